#include "crypto/keypair.h"

#include <sodium.h>
#include <stdexcept>

namespace keel {
namespace crypto {

namespace {

void ensure_sodium() {
  static const int init_result = sodium_init();
  if (init_result < 0) {
    throw std::runtime_error("libsodium initialization failed");
  }
}

} // namespace

Keypair Keypair::generate() {
  ensure_sodium();
  Keypair pair;
  if (crypto_sign_keypair(pair.public_key.data(), pair.secret_key.data()) != 0) {
    throw std::runtime_error("crypto_sign_keypair failed");
  }
  return pair;
}

Keypair Keypair::from_seed(const std::array<uint8_t, 32> &seed) {
  ensure_sodium();
  Keypair pair;
  if (crypto_sign_seed_keypair(pair.public_key.data(), pair.secret_key.data(),
                               seed.data()) != 0) {
    throw std::runtime_error("crypto_sign_seed_keypair failed");
  }
  return pair;
}

} // namespace crypto
} // namespace keel
