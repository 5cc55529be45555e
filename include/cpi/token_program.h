#pragma once

#include "cpi/call.h"

namespace keel {
namespace cpi {
namespace token_program {

/// SPL Token program id (TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA)
const PublicKey &id();

/// Single-byte instruction tags of the token program
constexpr uint8_t TRANSFER = 3;

/**
 * @brief Token transfer between two token accounts
 *
 * Accounts: [source (writable), destination (writable), authority (signer)].
 * Payload: tag 3 followed by the amount as u64.
 */
CallDescriptor transfer(const PublicKey &source, const PublicKey &destination,
                        const PublicKey &authority, uint64_t amount);

} // namespace token_program
} // namespace cpi
} // namespace keel
