#pragma once

#include "cpi/call.h"

namespace keel {
namespace cpi {
namespace system_program {

/// System program id: 11111111111111111111111111111111 (all zero bytes)
const PublicKey &id();

/// Instruction indices, encoded as a little-endian u32
enum class Instruction : uint32_t {
  CREATE_ACCOUNT = 0,
  ASSIGN = 1,
  TRANSFER = 2,
  ALLOCATE = 8
};

/// Accounts: [from (signer, writable), to (signer, writable)]
CallDescriptor create_account(const PublicKey &from, const PublicKey &to, Lamports lamports,
                              uint64_t space, const PublicKey &owner);

/// Accounts: [account (signer, writable)]
CallDescriptor assign(const PublicKey &account, const PublicKey &owner);

/// Accounts: [from (signer, writable), to (writable)]
CallDescriptor transfer(const PublicKey &from, const PublicKey &to, Lamports lamports);

/// Accounts: [account (signer, writable)]
CallDescriptor allocate(const PublicKey &account, uint64_t space);

} // namespace system_program
} // namespace cpi
} // namespace keel
