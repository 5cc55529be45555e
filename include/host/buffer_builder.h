#pragma once

#include "common/types.h"
#include <vector>

namespace keel {
namespace host {

using namespace keel::common;

/// Account contents as the host stores them
struct AccountState {
  Lamports lamports = 0;
  std::vector<uint8_t> data;
  PublicKey owner{};
  bool executable = false;
  Epoch rent_epoch = 0;

  bool operator==(const AccountState &other) const {
    return lamports == other.lamports && data == other.data && owner == other.owner &&
           executable == other.executable && rent_epoch == other.rent_epoch;
  }
  bool operator!=(const AccountState &other) const { return !(*this == other); }
};

/**
 * @brief Serialized program input plus where each account landed
 *
 * `records` has one entry per distinct account in first-appearance order;
 * `keys` holds the matching keys.
 */
struct SerializedInput {
  struct Record {
    size_t offset = 0;
    uint64_t original_data_len = 0;
  };

  std::vector<uint8_t> bytes;
  std::vector<Record> records;
  std::vector<PublicKey> keys;

  /**
   * @brief Read an account's current contents back out of the buffer
   *
   * Fails with InvalidInput when the program grew the data past the
   * reserved region.
   */
  Result<AccountState> read_account(size_t index) const;
};

/**
 * @brief Serializes accounts and a payload into the loader input format
 *
 * A key that repeats an earlier one becomes an 8-byte duplicate reference
 * and its signer/writable flags are merged into the first record.
 */
class InputBuilder {
public:
  InputBuilder &add_account(const PublicKey &key, const AccountState &state, bool is_signer,
                            bool is_writable);
  InputBuilder &set_instruction_data(std::vector<uint8_t> data);
  InputBuilder &set_program_id(const PublicKey &program_id);

  SerializedInput build() const;

private:
  struct Entry {
    PublicKey key;
    AccountState state;
    bool is_signer;
    bool is_writable;
  };

  std::vector<Entry> entries_;
  std::vector<uint8_t> instruction_data_;
  PublicKey program_id_{};
};

} // namespace host
} // namespace keel
