#include "runtime/buffer_decoder.h"
#include "common/logging.h"

namespace keel {
namespace runtime {

PublicKey DecodedInput::program_id_copy() const {
  PublicKey out;
  std::memcpy(out.data(), program_id, PUBKEY_BYTES);
  return out;
}

namespace {

Result<DecodedInput> truncated(const char *what, uint64_t offset, uint64_t length) {
  LOG_WARN("decoder", "Input truncated reading ", what, " at offset ", offset,
           " (length ", length, ")");
  return Result<DecodedInput>(Error::invalid_input(std::string("truncated input: ") + what));
}

} // namespace

Result<DecodedInput> decode(uint8_t *input, uint64_t length) {
  if (input == nullptr || length < wire::COUNT_SIZE) {
    return truncated("account count", 0, length);
  }

  const uint64_t count = wire::load_u64(input);
  // Each position needs at least a duplicate reference
  if (count > (length - wire::COUNT_SIZE) / wire::DUP_RECORD_SIZE) {
    return truncated("account records", wire::COUNT_SIZE, length);
  }

  DecodedInput decoded;
  decoded.slots.reserve(static_cast<size_t>(count));
  decoded.records.reserve(static_cast<size_t>(count));

  uint64_t offset = wire::COUNT_SIZE;
  for (uint64_t i = 0; i < count; ++i) {
    if (offset + wire::DUP_RECORD_SIZE > length) {
      return truncated("account record", offset, length);
    }

    uint8_t marker = input[offset + wire::OFF_DUP];
    if (marker != wire::NON_DUP_MARKER) {
      if (marker >= i) {
        LOG_WARN("decoder", "Duplicate marker at position ", i,
                 " references position ", static_cast<int>(marker));
        return Result<DecodedInput>(
            Error::invalid_input("duplicate account references a later position"));
      }
      decoded.slots.push_back(decoded.slots[marker]);
      offset += wire::DUP_RECORD_SIZE;
      continue;
    }

    if (offset + wire::HEADER_SIZE > length) {
      return truncated("account header", offset, length);
    }
    uint64_t data_len = wire::load_u64(input + offset + wire::OFF_DATA_LEN);
    if (data_len > wire::MAX_PERMITTED_DATA_LENGTH ||
        wire::record_size(static_cast<size_t>(data_len)) > length - offset) {
      return truncated("account data", offset, length);
    }

    decoded.slots.push_back(static_cast<uint32_t>(decoded.records.size()));
    decoded.records.push_back({input + offset, data_len});
    offset += wire::record_size(static_cast<size_t>(data_len));
  }

  offset = wire::align8(static_cast<size_t>(offset));
  if (offset + 8 > length) {
    return truncated("instruction data length", offset, length);
  }
  uint64_t data_len = wire::load_u64(input + offset);
  offset += 8;
  if (data_len > length - offset || length - offset - data_len < wire::PROGRAM_ID_SIZE) {
    return truncated("instruction data", offset, length);
  }

  decoded.instruction_data = input + offset;
  decoded.instruction_data_len = data_len;
  decoded.program_id = input + offset + data_len;

  LOG_TRACE("decoder", "Decoded ", count, " accounts (", decoded.records.size(),
            " distinct), ", data_len, " bytes of instruction data");
  return Result<DecodedInput>(std::move(decoded));
}

} // namespace runtime
} // namespace keel
