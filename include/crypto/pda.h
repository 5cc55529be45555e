#pragma once

#include "common/types.h"
#include "crypto/hashing.h"
#include <optional>
#include <vector>

namespace keel {
namespace crypto {

using common::PublicKey;

/// Maximum number of seeds, bump included
constexpr size_t MAX_SEEDS = 16;

/// Maximum length of a single seed
constexpr size_t MAX_SEED_LEN = 32;

/// Owned seed list, as presented by a signer of a cross-program call
using SeedList = std::vector<std::vector<uint8_t>>;

/**
 * @brief True if the 32 bytes decompress to a point on the ed25519 curve
 *
 * Matches curve25519-dalek's CompressedEdwardsY::decompress: the y
 * coordinate is taken mod p with the sign bit ignored, and the point exists
 * iff (y^2 - 1) / (d*y^2 + 1) is a square. Subgroup membership is not
 * checked.
 */
bool is_on_curve(const PublicKey &key);

/**
 * @brief Derive a program address from seeds (the bump, if any, included)
 *
 * address = SHA-256(seed_0 || ... || seed_n || program_id || "ProgramDerivedAddress")
 *
 * @return The address, or std::nullopt when the seeds exceed the limits or
 *         the hash lands on the curve
 */
std::optional<PublicKey> create_program_address(const std::vector<ByteSlice> &seeds,
                                                const PublicKey &program_id);
std::optional<PublicKey> create_program_address(const SeedList &seeds,
                                                const PublicKey &program_id);

/// Address and bump found by searching bumps from 255 downward
struct ProgramAddress {
  PublicKey address;
  uint8_t bump;
};

/**
 * @brief Find the canonical bump for seeds (client-side helper)
 *
 * Programs verify a supplied bump with create_program_address instead of
 * searching.
 */
std::optional<ProgramAddress> find_program_address(const SeedList &seeds,
                                                   const PublicKey &program_id);

} // namespace crypto
} // namespace keel
