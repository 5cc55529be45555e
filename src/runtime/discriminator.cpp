#include "runtime/discriminator.h"
#include "crypto/hashing.h"
#include "runtime/wire_format.h"

namespace keel {
namespace runtime {

uint64_t discriminator(const std::string &name_space, const std::string &name) {
  crypto::Hash32 hash = crypto::sha256(name_space + ":" + name);
  return wire::load_u64(hash.data());
}

uint64_t instruction_discriminator(const std::string &name) {
  return discriminator("global", name);
}

uint64_t account_discriminator(const std::string &name) {
  return discriminator("account", name);
}

std::array<uint8_t, DISCRIMINATOR_SIZE> discriminator_bytes(uint64_t tag) {
  std::array<uint8_t, DISCRIMINATOR_SIZE> out;
  wire::store_u64(out.data(), tag);
  return out;
}

} // namespace runtime
} // namespace keel
