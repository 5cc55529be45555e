#pragma once

#include "common/types.h"
#include "runtime/wire_format.h"
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace keel {
namespace runtime {

using namespace keel::common;

/**
 * @brief Non-owning view of one account record inside the input buffer
 *
 * Reads and writes go straight to buffer memory. The view also carries the
 * index of its canonical record, so two slots that name the same account
 * (duplicate markers) compare equal and never diverge.
 */
class AccountView {
public:
  AccountView() = default;
  AccountView(uint8_t *record, uint32_t canonical_index, uint64_t original_data_len)
      : record_(record), canonical_index_(canonical_index),
        original_data_len_(original_data_len) {}

  bool valid() const { return record_ != nullptr; }
  uint32_t canonical_index() const { return canonical_index_; }
  uint8_t *record() const { return record_; }

  // Flags
  bool is_signer() const { return record_[wire::OFF_IS_SIGNER] != 0; }
  bool is_writable() const { return record_[wire::OFF_IS_WRITABLE] != 0; }
  bool is_executable() const { return record_[wire::OFF_IS_EXECUTABLE] != 0; }

  // Keys
  const uint8_t *key() const { return record_ + wire::OFF_KEY; }
  const uint8_t *owner() const { return record_ + wire::OFF_OWNER; }
  PublicKey key_copy() const;
  PublicKey owner_copy() const;
  bool key_is(const PublicKey &expected) const {
    return std::memcmp(key(), expected.data(), PUBKEY_BYTES) == 0;
  }
  bool key_is(const uint8_t *expected) const {
    return std::memcmp(key(), expected, PUBKEY_BYTES) == 0;
  }
  bool owned_by(const PublicKey &program_id) const {
    return std::memcmp(owner(), program_id.data(), PUBKEY_BYTES) == 0;
  }
  bool owned_by(const uint8_t *program_id) const {
    return std::memcmp(owner(), program_id, PUBKEY_BYTES) == 0;
  }

  /// Change the owning program (caller must be the current owner)
  void assign(const PublicKey &new_owner);

  // Balance
  Lamports lamports() const { return wire::load_u64(record_ + wire::OFF_LAMPORTS); }
  void set_lamports(Lamports value) { wire::store_u64(record_ + wire::OFF_LAMPORTS, value); }

  // Data
  uint64_t data_len() const { return wire::load_u64(record_ + wire::OFF_DATA_LEN); }
  uint8_t *data() const { return record_ + wire::HEADER_SIZE; }

  /**
   * @brief Reinterpret the data region as a trivially copyable struct
   * @return nullptr when the account holds fewer than sizeof(T) bytes
   */
  template <typename T>
  T *data_as() const {
    static_assert(std::is_trivially_copyable<T>::value,
                  "account data overlays must be trivially copyable");
    if (data_len() < sizeof(T)) {
      return nullptr;
    }
    return reinterpret_cast<T *>(data());
  }

  /// Data length when the buffer was serialized; fixes where rent_epoch sits
  uint64_t original_data_len() const { return original_data_len_; }

  /**
   * @brief Change the data length in place
   *
   * Growth is bounded by the reserved region behind the original data. New
   * bytes are zeroed.
   */
  Result<bool> resize(uint64_t new_len);

  Epoch rent_epoch() const;

  bool same_account(const AccountView &other) const {
    return record_ == other.record_;
  }

private:
  uint8_t *record_ = nullptr;
  uint32_t canonical_index_ = 0;
  uint64_t original_data_len_ = 0;
};

} // namespace runtime
} // namespace keel
