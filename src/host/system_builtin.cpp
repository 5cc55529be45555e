#include "host/system_builtin.h"
#include "common/logging.h"
#include "cpi/system_program.h"
#include "runtime/buffer_decoder.h"

namespace keel {
namespace host {

using namespace keel::common;
using runtime::AccountView;
namespace wire = runtime::wire;

namespace {

uint64_t fail(SystemError error, const char *name) {
  LOG_WARN("system_program", name);
  return to_status(Error::custom(static_cast<uint32_t>(error), name));
}

bool is_fresh(const AccountView &account) {
  return account.data_len() == 0 && account.owned_by(cpi::system_program::id());
}

uint64_t debit(AccountView &from, AccountView &to, Lamports lamports) {
  if (from.lamports() < lamports) {
    LOG_WARN("system_program", "Transfer of ", lamports, " from account holding ",
             from.lamports());
    return fail(SystemError::RESULT_WITH_NEGATIVE_LAMPORTS, "insufficient lamports");
  }
  from.set_lamports(from.lamports() - lamports);
  to.set_lamports(to.lamports() + lamports);
  return 0;
}

uint64_t allocate(AccountView &account, uint64_t space) {
  auto resized = account.resize(space);
  if (resized.is_err()) {
    return fail(SystemError::INVALID_ACCOUNT_DATA_LENGTH, "requested space is too large");
  }
  return 0;
}

} // namespace

uint64_t system_program_entrypoint(uint8_t *input, uint64_t length, cpi::CallHost *) {
  auto decoded = runtime::decode(input, length);
  if (decoded.is_err()) {
    return to_status(decoded.error());
  }
  const runtime::DecodedInput &in = decoded.value();
  const uint8_t *data = in.instruction_data;
  const uint64_t data_len = in.instruction_data_len;

  if (data_len < 4) {
    return fail(SystemError::INVALID_INSTRUCTION_DATA, "missing instruction index");
  }
  const uint32_t index = wire::load_u32(data);

  auto require_accounts = [&](size_t n) { return in.account_count() >= n; };

  switch (static_cast<cpi::system_program::Instruction>(index)) {
  case cpi::system_program::Instruction::CREATE_ACCOUNT: {
    if (data_len != 4 + 8 + 8 + 32) {
      return fail(SystemError::INVALID_INSTRUCTION_DATA, "malformed CreateAccount");
    }
    if (!require_accounts(2)) {
      return fail(SystemError::NOT_ENOUGH_ACCOUNT_KEYS, "CreateAccount needs 2 accounts");
    }
    AccountView from = in.view(0);
    AccountView to = in.view(1);
    if (!from.is_signer() || !to.is_signer()) {
      return fail(SystemError::MISSING_REQUIRED_SIGNATURE, "CreateAccount needs both signatures");
    }
    if (to.lamports() != 0 || !is_fresh(to)) {
      return fail(SystemError::ACCOUNT_ALREADY_IN_USE, "account already in use");
    }
    const Lamports lamports = wire::load_u64(data + 4);
    const uint64_t space = wire::load_u64(data + 12);
    PublicKey owner;
    std::memcpy(owner.data(), data + 20, PUBKEY_BYTES);

    uint64_t status = debit(from, to, lamports);
    if (status != 0) {
      return status;
    }
    status = allocate(to, space);
    if (status != 0) {
      return status;
    }
    to.assign(owner);
    LOG_DEBUG("system_program", "Created ", to_hex(to.key_copy()), " with ", space,
              " bytes owned by ", to_hex(owner));
    return 0;
  }

  case cpi::system_program::Instruction::ASSIGN: {
    if (data_len != 4 + 32) {
      return fail(SystemError::INVALID_INSTRUCTION_DATA, "malformed Assign");
    }
    if (!require_accounts(1)) {
      return fail(SystemError::NOT_ENOUGH_ACCOUNT_KEYS, "Assign needs 1 account");
    }
    AccountView account = in.view(0);
    if (!account.is_signer()) {
      return fail(SystemError::MISSING_REQUIRED_SIGNATURE, "Assign needs a signature");
    }
    if (!account.owned_by(cpi::system_program::id())) {
      return fail(SystemError::INVALID_PROGRAM_ID, "Assign of an account the system does not own");
    }
    PublicKey owner;
    std::memcpy(owner.data(), data + 4, PUBKEY_BYTES);
    account.assign(owner);
    return 0;
  }

  case cpi::system_program::Instruction::TRANSFER: {
    if (data_len != 4 + 8) {
      return fail(SystemError::INVALID_INSTRUCTION_DATA, "malformed Transfer");
    }
    if (!require_accounts(2)) {
      return fail(SystemError::NOT_ENOUGH_ACCOUNT_KEYS, "Transfer needs 2 accounts");
    }
    AccountView from = in.view(0);
    AccountView to = in.view(1);
    if (!from.is_signer()) {
      return fail(SystemError::MISSING_REQUIRED_SIGNATURE, "Transfer needs the sender's signature");
    }
    if (!is_fresh(from)) {
      return fail(SystemError::INVALID_PROGRAM_ID, "Transfer from an account that carries data");
    }
    return debit(from, to, wire::load_u64(data + 4));
  }

  case cpi::system_program::Instruction::ALLOCATE: {
    if (data_len != 4 + 8) {
      return fail(SystemError::INVALID_INSTRUCTION_DATA, "malformed Allocate");
    }
    if (!require_accounts(1)) {
      return fail(SystemError::NOT_ENOUGH_ACCOUNT_KEYS, "Allocate needs 1 account");
    }
    AccountView account = in.view(0);
    if (!account.is_signer()) {
      return fail(SystemError::MISSING_REQUIRED_SIGNATURE, "Allocate needs a signature");
    }
    if (!is_fresh(account)) {
      return fail(SystemError::ACCOUNT_ALREADY_IN_USE, "account already in use");
    }
    return allocate(account, wire::load_u64(data + 4));
  }
  }

  return fail(SystemError::INVALID_INSTRUCTION_DATA, "unknown system instruction");
}

} // namespace host
} // namespace keel
