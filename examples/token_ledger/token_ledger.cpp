#include "token_ledger/token_ledger.h"
#include "common/logging.h"
#include "cpi/token_program.h"
#include "runtime/buffer_decoder.h"
#include "runtime/data_layout.h"

#include <algorithm>

namespace keel {
namespace examples {
namespace token_ledger {

using namespace keel::runtime;

namespace {

uint64_t fail(TokenError error) {
  LOG_DEBUG("token_ledger", "Rejected with error ", static_cast<uint32_t>(error));
  return to_status(Error::custom(static_cast<uint32_t>(error), "TokenError"));
}

bool is_token_account(const AccountView &view) {
  return view.owned_by(cpi::token_program::id()) &&
         view.data_len() >= token_account_layout().size();
}

uint64_t process_transfer(const DecodedInput &decoded) {
  if (decoded.account_count() < 3) {
    return fail(TokenError::NOT_ENOUGH_ACCOUNTS);
  }
  if (decoded.instruction_data_len != 9) {
    return fail(TokenError::INVALID_INSTRUCTION);
  }
  const uint64_t amount = read_le(decoded.instruction_data + 1, 8);

  AccountView source_view = decoded.view(0);
  AccountView destination_view = decoded.view(1);
  AccountView authority = decoded.view(2);
  if (!is_token_account(source_view) || !is_token_account(destination_view)) {
    return fail(TokenError::INVALID_ACCOUNT);
  }
  if (!source_view.is_writable() || !destination_view.is_writable()) {
    return fail(TokenError::INVALID_ACCOUNT);
  }

  LayoutAccessor source(token_account_layout(), source_view.data(), source_view.data_len());
  LayoutAccessor destination(token_account_layout(), destination_view.data(),
                             destination_view.data_len());

  auto source_owner = source.get_pubkey("owner");
  if (source_owner.is_err() || !authority.key_is(source_owner.value()) ||
      !authority.is_signer()) {
    return fail(TokenError::OWNER_MISMATCH);
  }
  auto source_mint = source.get_pubkey("mint");
  auto destination_mint = destination.get_pubkey("mint");
  if (source_mint.is_err() || destination_mint.is_err() ||
      source_mint.value() != destination_mint.value()) {
    return fail(TokenError::MINT_MISMATCH);
  }

  auto balance = source.get_unsigned("amount");
  auto received = destination.get_unsigned("amount");
  if (balance.is_err() || received.is_err()) {
    return fail(TokenError::INVALID_ACCOUNT);
  }
  if (balance.value() < amount) {
    return fail(TokenError::INSUFFICIENT_FUNDS);
  }
  if (source_view.same_account(destination_view)) {
    return 0;
  }
  if (received.value() > UINT64_MAX - amount) {
    return fail(TokenError::INVALID_ACCOUNT);
  }

  if (source.set_unsigned("amount", balance.value() - amount).is_err() ||
      destination.set_unsigned("amount", received.value() + amount).is_err()) {
    return fail(TokenError::INVALID_ACCOUNT);
  }
  LOG_DEBUG("token_ledger", "Transferred ", amount, " tokens");
  return 0;
}

} // namespace

const DataLayout &token_account_layout() {
  static const DataLayout layout = DataLayout().pubkey("mint").pubkey("owner").u64("amount");
  return layout;
}

std::vector<uint8_t> token_account_data(const common::PublicKey &mint,
                                        const common::PublicKey &owner, uint64_t amount) {
  std::vector<uint8_t> data(token_account_layout().size(), 0);
  std::copy(mint.begin(), mint.end(), data.begin());
  std::copy(owner.begin(), owner.end(), data.begin() + PUBKEY_BYTES);
  write_le(data.data() + 2 * PUBKEY_BYTES, 8, amount);
  return data;
}

uint64_t entrypoint(uint8_t *input, uint64_t length, cpi::CallHost *) {
  auto decoded = decode(input, length);
  if (decoded.is_err()) {
    return to_status(decoded.error());
  }
  const DecodedInput &parsed = decoded.value();
  if (parsed.instruction_data_len == 0) {
    return fail(TokenError::INVALID_INSTRUCTION);
  }

  switch (parsed.instruction_data[0]) {
  case cpi::token_program::TRANSFER:
    return process_transfer(parsed);
  default:
    return fail(TokenError::INVALID_INSTRUCTION);
  }
}

} // namespace token_ledger
} // namespace examples
} // namespace keel
