#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace keel {
namespace crypto {

/// SHA-256 digest
using Hash32 = std::array<uint8_t, 32>;

/// Non-owning view of one hash input part
struct ByteSlice {
  const uint8_t *data;
  size_t len;
};

/**
 * @brief SHA-256 of a contiguous buffer (OpenSSL EVP)
 * @throws std::runtime_error if the OpenSSL digest context cannot be used
 */
Hash32 sha256(const uint8_t *data, size_t len);
Hash32 sha256(const std::string &text);

/// SHA-256 over the concatenation of several parts without joining them
Hash32 sha256(const std::vector<ByteSlice> &parts);

} // namespace crypto
} // namespace keel
