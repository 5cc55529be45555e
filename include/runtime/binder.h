#pragma once

#include "runtime/account_view.h"
#include "runtime/buffer_decoder.h"
#include "runtime/schema.h"
#include <array>
#include <optional>
#include <vector>

namespace keel {
namespace runtime {

/**
 * @brief Views bound to an instruction's declared accounts, in order
 *
 * Fixed capacity so the fast path never allocates.
 */
class BoundAccounts {
public:
  size_t size() const { return count_; }
  bool empty() const { return count_ == 0; }

  AccountView &operator[](size_t index) { return views_[index]; }
  const AccountView &operator[](size_t index) const { return views_[index]; }

  void push_back(const AccountView &view) { views_[count_++] = view; }

  const AccountView *begin() const { return views_.data(); }
  const AccountView *end() const { return views_.data() + count_; }

private:
  std::array<AccountView, MAX_INSTRUCTION_ACCOUNTS> views_;
  size_t count_ = 0;
};

/**
 * @brief Data length a descriptor pins in the input buffer
 *
 * Explicit size first, then the layout size. An init account has not been
 * created yet, so it is expected empty.
 */
std::optional<size_t> fixed_data_size(const AccountDescriptor &descriptor);

/**
 * @brief Generic positional bind
 *
 * Position i binds to descriptor i. Fails with AccountMissing when the input
 * lists fewer accounts than declared and DataSizeMismatch when a declared
 * size differs from the live data length.
 */
Result<BoundAccounts> bind(const DecodedInput &decoded,
                           const std::vector<AccountDescriptor> &descriptors);

/**
 * @brief Precomputed byte offsets for a descriptor list of fixed sizes
 *
 * When every account size is known, each record starts at a constant offset
 * and the payload length field sits at a constant offset after them.
 * matches() confirms an input has exactly that shape; bind() is then plain
 * pointer arithmetic.
 */
class OffsetTable {
public:
  /// Table for the descriptors, or std::nullopt if any size is open
  static std::optional<OffsetTable> build(const std::vector<AccountDescriptor> &descriptors);

  /**
   * @brief True when the input has the precomputed shape
   *
   * Compares the account count and total length, and each record's
   * duplicate marker and data length against the table.
   */
  bool matches(const uint8_t *input, uint64_t length) const;

  /// Bind views; only valid after matches() returned true
  BoundAccounts bind(uint8_t *input) const;

  const uint8_t *instruction_data(const uint8_t *input) const {
    return input + payload_length_offset_ + 8;
  }
  uint64_t instruction_data_len(const uint8_t *input) const {
    return wire::load_u64(input + payload_length_offset_);
  }
  const uint8_t *program_id(const uint8_t *input) const {
    return instruction_data(input) + instruction_data_len(input);
  }

  size_t account_count() const { return record_offsets_.size(); }
  size_t record_offset(size_t index) const { return record_offsets_[index]; }
  size_t payload_length_offset() const { return payload_length_offset_; }

private:
  std::vector<size_t> record_offsets_;
  std::vector<uint64_t> data_sizes_;
  size_t payload_length_offset_ = 0;
};

} // namespace runtime
} // namespace keel
