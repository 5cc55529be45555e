#include "cpi/account_ops.h"
#include "common/logging.h"
#include "cpi/system_program.h"
#include "runtime/discriminator.h"

#include <cstring>

namespace keel {
namespace cpi {

Lamports rent_exempt_minimum(uint64_t space) {
  return (ACCOUNT_STORAGE_OVERHEAD + space) * LAMPORTS_PER_BYTE_YEAR * EXEMPTION_THRESHOLD_YEARS;
}

Result<bool> transfer_lamports(AccountView &from, AccountView &to, Lamports amount) {
  if (from.same_account(to)) {
    return ok();
  }
  Lamports available = from.lamports();
  if (available < amount) {
    LOG_WARN("account_ops", "Insufficient lamports: have ", available, ", need ", amount);
    return Result<bool>(Error::invalid_input("insufficient lamports"));
  }
  Lamports credited = to.lamports();
  if (credited + amount < credited) {
    return Result<bool>(Error::invalid_input("lamport overflow"));
  }
  from.set_lamports(available - amount);
  to.set_lamports(credited + amount);
  return ok();
}

Result<bool> close_account(AccountView &account, AccountView &destination) {
  if (account.same_account(destination)) {
    return Result<bool>(Error::invalid_input("cannot close an account into itself"));
  }
  auto moved = transfer_lamports(account, destination, account.lamports());
  if (moved.is_err()) {
    return moved;
  }

  std::memset(account.data(), 0, static_cast<size_t>(account.data_len()));
  auto resized = account.resize(0);
  if (resized.is_err()) {
    return resized;
  }
  account.assign(system_program::id());

  LOG_DEBUG("account_ops", "Closed account ", to_hex(account.key_copy()));
  return ok();
}

Result<bool> write_discriminator(AccountView &account, const runtime::DataLayout &layout) {
  if (!layout.has_discriminator()) {
    return ok();
  }
  if (account.data_len() < runtime::DISCRIMINATOR_SIZE) {
    return Result<bool>(Error::data_size_mismatch("account too small for a discriminator"));
  }
  runtime::wire::store_u64(account.data(), layout.discriminator());
  return ok();
}

bool is_uninitialized(const AccountView &account) {
  return account.lamports() == 0 && account.data_len() == 0;
}

} // namespace cpi
} // namespace keel
