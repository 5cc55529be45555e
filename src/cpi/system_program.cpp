#include "cpi/system_program.h"
#include "runtime/wire_format.h"

namespace keel {
namespace cpi {
namespace system_program {

namespace {

class Payload {
public:
  explicit Payload(Instruction index) { u32(static_cast<uint32_t>(index)); }

  Payload &u32(uint32_t value) {
    size_t at = bytes_.size();
    bytes_.resize(at + 4);
    runtime::wire::store_u32(bytes_.data() + at, value);
    return *this;
  }

  Payload &u64(uint64_t value) {
    size_t at = bytes_.size();
    bytes_.resize(at + 8);
    runtime::wire::store_u64(bytes_.data() + at, value);
    return *this;
  }

  Payload &key(const PublicKey &key) {
    bytes_.insert(bytes_.end(), key.begin(), key.end());
    return *this;
  }

  std::vector<uint8_t> take() { return std::move(bytes_); }

private:
  std::vector<uint8_t> bytes_;
};

} // namespace

const PublicKey &id() {
  static const PublicKey system_id{};
  return system_id;
}

CallDescriptor create_account(const PublicKey &from, const PublicKey &to, Lamports lamports,
                              uint64_t space, const PublicKey &owner) {
  return build_call(id(), {AccountMeta::writable(from, true), AccountMeta::writable(to, true)},
                    Payload(Instruction::CREATE_ACCOUNT).u64(lamports).u64(space).key(owner).take());
}

CallDescriptor assign(const PublicKey &account, const PublicKey &owner) {
  return build_call(id(), {AccountMeta::writable(account, true)},
                    Payload(Instruction::ASSIGN).key(owner).take());
}

CallDescriptor transfer(const PublicKey &from, const PublicKey &to, Lamports lamports) {
  return build_call(id(), {AccountMeta::writable(from, true), AccountMeta::writable(to)},
                    Payload(Instruction::TRANSFER).u64(lamports).take());
}

CallDescriptor allocate(const PublicKey &account, uint64_t space) {
  return build_call(id(), {AccountMeta::writable(account, true)},
                    Payload(Instruction::ALLOCATE).u64(space).take());
}

} // namespace system_program
} // namespace cpi
} // namespace keel
