#pragma once

#include "common/types.h"
#include "crypto/keypair.h"
#include "host/buffer_builder.h"
#include "runtime/args.h"
#include "runtime/discriminator.h"

#include <vector>

// Shared fixtures for building program inputs and host accounts
namespace test_helpers {

using keel::common::Lamports;
using keel::common::PublicKey;
using keel::host::AccountState;

inline PublicKey filled_key(uint8_t byte) {
  PublicKey key{};
  key.fill(byte);
  return key;
}

/// Ordinary key on the curve, as a wallet would hold
inline PublicKey wallet_key() { return keel::crypto::Keypair::generate().public_key; }

inline AccountState system_account(Lamports lamports) {
  AccountState state;
  state.lamports = lamports;
  return state;
}

inline AccountState owned_account(const PublicKey &owner, Lamports lamports,
                                  std::vector<uint8_t> data = {}) {
  AccountState state;
  state.owner = owner;
  state.lamports = lamports;
  state.data = std::move(data);
  return state;
}

/// Eight-byte tag followed by the payload
inline std::vector<uint8_t> tagged(const std::string &instruction,
                                   const std::vector<uint8_t> &payload = {}) {
  auto tag = keel::runtime::discriminator_bytes(
      keel::runtime::instruction_discriminator(instruction));
  std::vector<uint8_t> out(tag.begin(), tag.end());
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

inline std::vector<uint8_t> u64_bytes(uint64_t value) {
  std::vector<uint8_t> out(8);
  for (size_t i = 0; i < 8; ++i) {
    out[i] = static_cast<uint8_t>(value >> (8 * i));
  }
  return out;
}

} // namespace test_helpers
