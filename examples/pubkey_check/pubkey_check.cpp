#include "pubkey_check/pubkey_check.h"
#include "common/example_ids.h"

namespace keel {
namespace examples {
namespace pubkey_check {

using namespace keel::runtime;

const common::PublicKey &program_id() {
  static const common::PublicKey id = program_id_from_label("pubkey_check");
  return id;
}

namespace {

ProgramSpec build_spec() {
  InstructionSpec check("check", {unchecked("account").sized(0)});
  return ProgramSpec(program_id(), DispatchShape::SINGLE, {check});
}

Result<bool> check(Context &ctx) {
  AccountView &account = ctx.account("account");
  if (!account.key_is(account.owner())) {
    return Result<bool>(
        Error::custom(static_cast<uint32_t>(PubkeyError::INVALID_KEY), "InvalidKey"));
  }
  return ok();
}

} // namespace

const Program &program() {
  static const Program instance = [] {
    Program p(build_spec());
    p.on("check", check);
    return p;
  }();
  return instance;
}

uint64_t entrypoint(uint8_t *input, uint64_t length, cpi::CallHost *host) {
  return program().entrypoint(input, length, host);
}

} // namespace pubkey_check
} // namespace examples
} // namespace keel
