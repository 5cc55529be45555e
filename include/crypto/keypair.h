#pragma once

#include "common/types.h"
#include <array>

namespace keel {
namespace crypto {

using common::PublicKey;

/// Ed25519 secret key in libsodium's 64-byte (seed || public key) form
using SecretKey = std::array<uint8_t, 64>;

/**
 * @brief Ed25519 key pair for account keys that must lie on the curve
 *
 * Programs never hold private keys; the local host and tests use key pairs
 * to create ordinary (non-derived) accounts and signers.
 */
struct Keypair {
  PublicKey public_key{};
  SecretKey secret_key{};

  /// Fresh random key pair
  static Keypair generate();

  /// Deterministic key pair from a 32-byte seed
  static Keypair from_seed(const std::array<uint8_t, 32> &seed);
};

} // namespace crypto
} // namespace keel
