#pragma once

#include "common/types.h"
#include "cpi/call.h"
#include "runtime/data_layout.h"

namespace keel {
namespace examples {
namespace token_ledger {

/**
 * @brief Minimal token ledger answering the token program's transfer
 *
 * Written directly against the decoder rather than a ProgramSpec, the way a
 * hand-tuned program would be. Token accounts hold
 * { mint: pubkey, owner: pubkey, amount: u64 } with no discriminator and are
 * owned by cpi::token_program::id().
 */
enum class TokenError : uint32_t {
  INSUFFICIENT_FUNDS = 1,
  MINT_MISMATCH = 3,
  OWNER_MISMATCH = 4,
  INVALID_INSTRUCTION = 12,
  NOT_ENOUGH_ACCOUNTS = 13,
  INVALID_ACCOUNT = 14
};

const runtime::DataLayout &token_account_layout();

/// Serialized token account state
std::vector<uint8_t> token_account_data(const common::PublicKey &mint,
                                        const common::PublicKey &owner, uint64_t amount);

uint64_t entrypoint(uint8_t *input, uint64_t length, cpi::CallHost *host);

} // namespace token_ledger
} // namespace examples
} // namespace keel
