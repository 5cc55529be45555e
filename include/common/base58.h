#pragma once

#include "common/types.h"
#include <string>
#include <vector>

namespace keel {
namespace common {

/// Bitcoin/Solana base58 alphabet encoding of arbitrary bytes
std::string encode_base58(const uint8_t *data, size_t len);
std::string encode_base58(const PublicKey &key);

/// Decode base58; fails on characters outside the alphabet
Result<std::vector<uint8_t>> decode_base58(const std::string &encoded);

/// Decode a base58 string that must yield exactly 32 bytes
Result<PublicKey> pubkey_from_base58(const std::string &encoded);

} // namespace common
} // namespace keel
