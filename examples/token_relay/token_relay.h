#pragma once

#include "crypto/pda.h"
#include "runtime/program.h"

namespace keel {
namespace examples {
namespace token_relay {

/**
 * @brief Moves tokens held by a program derived authority
 *
 * forward { amount: u64, bump: u8 }
 *   vault_authority  PDA ["vault"], signs the token transfer through seeds
 *   source, destination  token accounts (writable)
 *   token_program
 *
 * recurse { remaining: u8 }
 *   Calls itself `remaining` more times; exercises the call depth limit.
 */
const common::PublicKey &program_id();
const runtime::Program &program();

const runtime::DataLayout &forward_args();
const runtime::DataLayout &recurse_args();

/// Vault authority address and its bump
std::optional<crypto::ProgramAddress> vault_authority();

uint64_t entrypoint(uint8_t *input, uint64_t length, cpi::CallHost *host);

} // namespace token_relay
} // namespace examples
} // namespace keel
