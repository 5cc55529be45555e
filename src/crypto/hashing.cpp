#include "crypto/hashing.h"

#include <openssl/evp.h>
#include <stdexcept>

namespace keel {
namespace crypto {

Hash32 sha256(const std::vector<ByteSlice> &parts) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }

  for (const auto &part : parts) {
    if (part.len == 0) {
      continue;
    }
    if (EVP_DigestUpdate(mdctx, part.data, part.len) != 1) {
      EVP_MD_CTX_free(mdctx);
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }

  Hash32 digest{};
  unsigned int digest_len = 0;
  if (EVP_DigestFinal_ex(mdctx, digest.data(), &digest_len) != 1 ||
      digest_len != digest.size()) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  EVP_MD_CTX_free(mdctx);
  return digest;
}

Hash32 sha256(const uint8_t *data, size_t len) {
  return sha256(std::vector<ByteSlice>{{data, len}});
}

Hash32 sha256(const std::string &text) {
  return sha256(reinterpret_cast<const uint8_t *>(text.data()), text.size());
}

} // namespace crypto
} // namespace keel
