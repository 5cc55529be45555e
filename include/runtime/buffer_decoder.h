#pragma once

#include "common/types.h"
#include "runtime/account_view.h"
#include <cstdint>
#include <vector>

namespace keel {
namespace runtime {

/**
 * @brief Result of parsing one serialized program input
 *
 * Every pointer aliases the caller's buffer; nothing is copied. `records`
 * holds one entry per distinct account (the canonical table), `slots` maps
 * each position in the account list onto that table.
 */
struct DecodedInput {
  struct Record {
    uint8_t *header = nullptr;
    uint64_t original_data_len = 0;
  };

  std::vector<Record> records;
  std::vector<uint32_t> slots;
  const uint8_t *instruction_data = nullptr;
  uint64_t instruction_data_len = 0;
  const uint8_t *program_id = nullptr;

  /// Number of account positions, duplicates included
  size_t account_count() const { return slots.size(); }

  /// View for an account position; duplicate positions share a record
  AccountView view(size_t slot) const {
    uint32_t canonical = slots[slot];
    const Record &record = records[canonical];
    return AccountView(record.header, canonical, record.original_data_len);
  }

  PublicKey program_id_copy() const;
};

/**
 * @brief Parse the serialized input
 *
 * Validates every length against the buffer end; fails with InvalidInput
 * when the buffer is truncated or a duplicate marker points at a position
 * that has not been read yet.
 */
Result<DecodedInput> decode(uint8_t *input, uint64_t length);

} // namespace runtime
} // namespace keel
