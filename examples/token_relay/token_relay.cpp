#include "token_relay/token_relay.h"
#include "common/example_ids.h"
#include "common/logging.h"
#include "cpi/token_program.h"

namespace keel {
namespace examples {
namespace token_relay {

using namespace keel::runtime;

namespace {

const char VAULT_SEED[] = "vault";

ProgramSpec build_spec() {
  std::vector<InstructionSpec> instructions;
  instructions.emplace_back(
      "forward",
      std::vector<AccountDescriptor>{
          unchecked("vault_authority").with_seeds({Seed::literal(VAULT_SEED)}, BumpSpec::arg("bump")),
          mut("source"), mut("destination"),
          runtime::program("token_program", cpi::token_program::id())},
      forward_args());
  instructions.emplace_back("recurse", std::vector<AccountDescriptor>{}, recurse_args());
  return ProgramSpec(program_id(), DispatchShape::PER_INSTRUCTION, std::move(instructions));
}

Result<bool> forward(Context &ctx) {
  auto amount = ctx.args().get_u64("amount");
  if (amount.is_err()) {
    return Result<bool>(amount.error());
  }
  auto seeds = ctx.signer_seeds("vault_authority");
  if (seeds.is_err()) {
    return Result<bool>(seeds.error());
  }

  AccountView &authority = ctx.account("vault_authority");
  AccountView &source = ctx.account("source");
  AccountView &destination = ctx.account("destination");
  auto call = cpi::token_program::transfer(source.key_copy(), destination.key_copy(),
                                           authority.key_copy(), amount.value());
  return ctx.invoke_signed(call, {source, destination, authority}, {seeds.value()});
}

Result<bool> recurse(Context &ctx) {
  auto remaining = ctx.args().get_u8("remaining");
  if (remaining.is_err()) {
    return Result<bool>(remaining.error());
  }
  if (remaining.value() == 0) {
    return ok();
  }

  ArgValues next;
  next.set_unsigned("remaining", remaining.value() - 1);
  auto data = encode_instruction("recurse", recurse_args(), next);
  if (data.is_err()) {
    return Result<bool>(data.error());
  }
  LOG_DEBUG("token_relay", "Recursing, ", static_cast<int>(remaining.value()), " left");
  return ctx.invoke(cpi::build_call(program_id(), {}, data.value()), {});
}

} // namespace

const common::PublicKey &program_id() {
  static const common::PublicKey id = program_id_from_label("token_relay");
  return id;
}

const DataLayout &forward_args() {
  static const DataLayout layout = DataLayout().u64("amount").u8("bump");
  return layout;
}

const DataLayout &recurse_args() {
  static const DataLayout layout = DataLayout().u8("remaining");
  return layout;
}

std::optional<crypto::ProgramAddress> vault_authority() {
  crypto::SeedList seeds;
  seeds.emplace_back(VAULT_SEED, VAULT_SEED + sizeof(VAULT_SEED) - 1);
  return crypto::find_program_address(seeds, program_id());
}

const Program &program() {
  static const Program instance = [] {
    Program p(build_spec());
    p.on("forward", forward).on("recurse", recurse);
    return p;
  }();
  return instance;
}

uint64_t entrypoint(uint8_t *input, uint64_t length, cpi::CallHost *host) {
  return program().entrypoint(input, length, host);
}

} // namespace token_relay
} // namespace examples
} // namespace keel
