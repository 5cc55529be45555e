#include "runtime/account_view.h"
#include "common/logging.h"

namespace keel {
namespace runtime {

PublicKey AccountView::key_copy() const {
  PublicKey out;
  std::memcpy(out.data(), key(), PUBKEY_BYTES);
  return out;
}

PublicKey AccountView::owner_copy() const {
  PublicKey out;
  std::memcpy(out.data(), owner(), PUBKEY_BYTES);
  return out;
}

void AccountView::assign(const PublicKey &new_owner) {
  std::memcpy(record_ + wire::OFF_OWNER, new_owner.data(), PUBKEY_BYTES);
}

Result<bool> AccountView::resize(uint64_t new_len) {
  const uint64_t limit = original_data_len_ + wire::MAX_PERMITTED_DATA_INCREASE;
  if (new_len > limit || new_len > wire::MAX_PERMITTED_DATA_LENGTH) {
    LOG_WARN("account", "Resize of ", to_hex(key_copy()), " to ", new_len,
             " bytes exceeds limit ", limit);
    return Result<bool>(Error::invalid_input("account resize beyond growth region"));
  }

  uint64_t current = data_len();
  if (new_len > current) {
    std::memset(data() + current, 0, static_cast<size_t>(new_len - current));
  }
  wire::store_u64(record_ + wire::OFF_DATA_LEN, new_len);
  return ok();
}

Epoch AccountView::rent_epoch() const {
  return wire::load_u64(record_ + wire::rent_epoch_offset(original_data_len_));
}

} // namespace runtime
} // namespace keel
