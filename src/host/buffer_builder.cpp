#include "host/buffer_builder.h"
#include "runtime/wire_format.h"

#include <cstring>
#include <stdexcept>

namespace keel {
namespace host {

namespace wire = runtime::wire;

Result<AccountState> SerializedInput::read_account(size_t index) const {
  const uint8_t *record = bytes.data() + records[index].offset;
  const uint64_t original_len = records[index].original_data_len;
  uint64_t data_len = wire::load_u64(record + wire::OFF_DATA_LEN);
  if (data_len > original_len + wire::MAX_PERMITTED_DATA_INCREASE) {
    return Result<AccountState>(Error::invalid_input("account " + to_hex(keys[index]) +
                                                     " grew past its reserved region"));
  }

  AccountState state;
  state.lamports = wire::load_u64(record + wire::OFF_LAMPORTS);
  std::memcpy(state.owner.data(), record + wire::OFF_OWNER, PUBKEY_BYTES);
  state.executable = record[wire::OFF_IS_EXECUTABLE] != 0;

  const uint8_t *data = record + wire::HEADER_SIZE;
  state.data.assign(data, data + data_len);
  state.rent_epoch = wire::load_u64(record + wire::rent_epoch_offset(static_cast<size_t>(original_len)));
  return Result<AccountState>(std::move(state));
}

InputBuilder &InputBuilder::add_account(const PublicKey &key, const AccountState &state,
                                        bool is_signer, bool is_writable) {
  entries_.push_back({key, state, is_signer, is_writable});
  return *this;
}

InputBuilder &InputBuilder::set_instruction_data(std::vector<uint8_t> data) {
  instruction_data_ = std::move(data);
  return *this;
}

InputBuilder &InputBuilder::set_program_id(const PublicKey &program_id) {
  program_id_ = program_id;
  return *this;
}

SerializedInput InputBuilder::build() const {
  if (entries_.size() > 255) {
    throw std::invalid_argument("too many accounts for duplicate references");
  }

  // First position of each key, and merged privileges per key
  std::vector<int> first_position(entries_.size(), -1);
  std::vector<bool> signer(entries_.size()), writable(entries_.size());
  for (size_t i = 0; i < entries_.size(); ++i) {
    for (size_t j = 0; j < i; ++j) {
      if (entries_[j].key == entries_[i].key) {
        first_position[i] = static_cast<int>(j);
        break;
      }
    }
    size_t owner = first_position[i] < 0 ? i : static_cast<size_t>(first_position[i]);
    signer[owner] = signer[owner] || entries_[i].is_signer;
    writable[owner] = writable[owner] || entries_[i].is_writable;
  }

  size_t size = wire::COUNT_SIZE;
  for (size_t i = 0; i < entries_.size(); ++i) {
    size += first_position[i] < 0 ? wire::record_size(entries_[i].state.data.size())
                                   : wire::DUP_RECORD_SIZE;
  }
  size = wire::align8(size) + 8 + instruction_data_.size() + wire::PROGRAM_ID_SIZE;

  SerializedInput out;
  out.bytes.assign(size, 0);
  uint8_t *base = out.bytes.data();
  wire::store_u64(base, entries_.size());

  size_t offset = wire::COUNT_SIZE;
  for (size_t i = 0; i < entries_.size(); ++i) {
    uint8_t *record = base + offset;
    if (first_position[i] >= 0) {
      record[wire::OFF_DUP] = static_cast<uint8_t>(first_position[i]);
      offset += wire::DUP_RECORD_SIZE;
      continue;
    }

    const Entry &entry = entries_[i];
    record[wire::OFF_DUP] = wire::NON_DUP_MARKER;
    record[wire::OFF_IS_SIGNER] = signer[i] ? 1 : 0;
    record[wire::OFF_IS_WRITABLE] = writable[i] ? 1 : 0;
    record[wire::OFF_IS_EXECUTABLE] = entry.state.executable ? 1 : 0;
    std::memcpy(record + wire::OFF_KEY, entry.key.data(), PUBKEY_BYTES);
    std::memcpy(record + wire::OFF_OWNER, entry.state.owner.data(), PUBKEY_BYTES);
    wire::store_u64(record + wire::OFF_LAMPORTS, entry.state.lamports);
    wire::store_u64(record + wire::OFF_DATA_LEN, entry.state.data.size());
    if (!entry.state.data.empty()) {
      std::memcpy(record + wire::HEADER_SIZE, entry.state.data.data(), entry.state.data.size());
    }
    wire::store_u64(record + wire::rent_epoch_offset(entry.state.data.size()),
                    entry.state.rent_epoch);

    out.records.push_back({offset, entry.state.data.size()});
    out.keys.push_back(entry.key);
    offset += wire::record_size(entry.state.data.size());
  }

  offset = wire::align8(offset);
  wire::store_u64(base + offset, instruction_data_.size());
  offset += 8;
  if (!instruction_data_.empty()) {
    std::memcpy(base + offset, instruction_data_.data(), instruction_data_.size());
  }
  offset += instruction_data_.size();
  std::memcpy(base + offset, program_id_.data(), PUBKEY_BYTES);
  return out;
}

} // namespace host
} // namespace keel
