#include "cpi/token_program.h"
#include "common/base58.h"
#include "runtime/wire_format.h"

#include <stdexcept>

namespace keel {
namespace cpi {
namespace token_program {

const PublicKey &id() {
  static const PublicKey token_id = [] {
    auto key = pubkey_from_base58("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA");
    if (key.is_err()) {
      throw std::logic_error("token program id does not decode: " + key.error().message);
    }
    return key.value();
  }();
  return token_id;
}

CallDescriptor transfer(const PublicKey &source, const PublicKey &destination,
                        const PublicKey &authority, uint64_t amount) {
  std::vector<uint8_t> data(9);
  data[0] = TRANSFER;
  runtime::wire::store_u64(data.data() + 1, amount);
  return build_call(id(),
                    {AccountMeta::writable(source), AccountMeta::writable(destination),
                     AccountMeta::readonly(authority, true)},
                    std::move(data));
}

} // namespace token_program
} // namespace cpi
} // namespace keel
