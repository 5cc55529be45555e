#include "runtime/binder.h"
#include "common/logging.h"

namespace keel {
namespace runtime {

std::optional<size_t> fixed_data_size(const AccountDescriptor &descriptor) {
  if (descriptor.is_init()) {
    return size_t{0};
  }
  if (descriptor.data_size) {
    return descriptor.data_size;
  }
  if (descriptor.layout) {
    return descriptor.layout->size();
  }
  return std::nullopt;
}

Result<BoundAccounts> bind(const DecodedInput &decoded,
                           const std::vector<AccountDescriptor> &descriptors) {
  if (descriptors.size() > MAX_INSTRUCTION_ACCOUNTS) {
    LOG_WARN("binder", "Refusing to bind ", descriptors.size(), " accounts, limit is ",
             MAX_INSTRUCTION_ACCOUNTS);
    return Result<BoundAccounts>(Error::invalid_input(
        "instruction declares more than " + std::to_string(MAX_INSTRUCTION_ACCOUNTS) +
        " accounts"));
  }
  if (decoded.account_count() < descriptors.size()) {
    LOG_WARN("binder", "Instruction declares ", descriptors.size(), " accounts but input has ",
             decoded.account_count());
    return Result<BoundAccounts>(Error::account_missing(
        "expected " + std::to_string(descriptors.size()) + " accounts, got " +
        std::to_string(decoded.account_count())));
  }

  BoundAccounts bound;
  for (size_t i = 0; i < descriptors.size(); ++i) {
    const AccountDescriptor &descriptor = descriptors[i];
    AccountView view = decoded.view(i);

    auto expected = fixed_data_size(descriptor);
    if (expected && !descriptor.is_init() && view.data_len() != *expected) {
      LOG_WARN("binder", "Account '", descriptor.name, "' holds ", view.data_len(),
               " bytes, declared ", *expected);
      return Result<BoundAccounts>(
          Error::data_size_mismatch("account " + descriptor.name + " has unexpected data size"));
    }
    bound.push_back(view);
  }
  return Result<BoundAccounts>(bound);
}

std::optional<OffsetTable> OffsetTable::build(const std::vector<AccountDescriptor> &descriptors) {
  if (descriptors.size() > MAX_INSTRUCTION_ACCOUNTS) {
    return std::nullopt;
  }

  OffsetTable table;
  size_t offset = wire::COUNT_SIZE;
  for (const auto &descriptor : descriptors) {
    auto size = fixed_data_size(descriptor);
    if (!size) {
      return std::nullopt;
    }
    table.record_offsets_.push_back(offset);
    table.data_sizes_.push_back(*size);
    offset += wire::record_size(*size);
  }
  table.payload_length_offset_ = wire::align8(offset);
  return table;
}

bool OffsetTable::matches(const uint8_t *input, uint64_t length) const {
  const uint64_t fixed = payload_length_offset_ + 8 + wire::PROGRAM_ID_SIZE;
  if (input == nullptr || length < fixed) {
    return false;
  }
  if (wire::load_u64(input) != record_offsets_.size()) {
    return false;
  }
  if (instruction_data_len(input) != length - fixed) {
    return false;
  }
  for (size_t i = 0; i < record_offsets_.size(); ++i) {
    const uint8_t *record = input + record_offsets_[i];
    if (record[wire::OFF_DUP] != wire::NON_DUP_MARKER ||
        wire::load_u64(record + wire::OFF_DATA_LEN) != data_sizes_[i]) {
      return false;
    }
  }
  return true;
}

BoundAccounts OffsetTable::bind(uint8_t *input) const {
  BoundAccounts bound;
  for (size_t i = 0; i < record_offsets_.size(); ++i) {
    bound.push_back(AccountView(input + record_offsets_[i], static_cast<uint32_t>(i),
                                data_sizes_[i]));
  }
  return bound;
}

} // namespace runtime
} // namespace keel
