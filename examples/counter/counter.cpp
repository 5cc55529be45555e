#include "counter/counter.h"
#include "common/example_ids.h"
#include "common/logging.h"
#include "cpi/system_program.h"

namespace keel {
namespace examples {
namespace counter {

using namespace keel::runtime;

namespace {

const char COUNTER_SEED[] = "counter";

Result<bool> fail(CounterError error, const char *name) {
  return Result<bool>(Error::custom(static_cast<uint32_t>(error), name));
}

std::vector<Seed> counter_seeds() {
  return {Seed::literal(COUNTER_SEED), Seed::account_key("authority")};
}

AccountDescriptor existing_counter() {
  return account("counter", counter_layout())
      .require_writable()
      .has_one("authority")
      .with_seeds(counter_seeds(), BumpSpec::data("bump"));
}

ProgramSpec build_spec() {
  std::vector<InstructionSpec> instructions;
  instructions.emplace_back(
      "initialize",
      std::vector<AccountDescriptor>{
          signer("payer").require_writable(), signer("authority"),
          account("counter", counter_layout())
              .init("payer")
              .with_seeds(counter_seeds(), BumpSpec::arg("bump")),
          runtime::program("system_program", cpi::system_program::id())},
      initialize_args());
  instructions.emplace_back(
      "increment", std::vector<AccountDescriptor>{signer("authority"), existing_counter()});
  instructions.emplace_back(
      "set_count", std::vector<AccountDescriptor>{signer("authority"), existing_counter()},
      set_count_args());
  instructions.emplace_back(
      "action", std::vector<AccountDescriptor>{signer("authority"), existing_counter()},
      action_args());
  instructions.emplace_back("close",
                            std::vector<AccountDescriptor>{signer("authority"),
                                                           existing_counter().close_to("destination"),
                                                           mut("destination")});
  return ProgramSpec(program_id(), DispatchShape::PER_INSTRUCTION, std::move(instructions));
}

Result<bool> store_count(Context &ctx, uint64_t value) {
  return ctx.fields("counter").set_unsigned("count", value);
}

Result<bool> initialize(Context &ctx) {
  auto bump = ctx.args().get_u8("bump");
  if (bump.is_err()) {
    return Result<bool>(bump.error());
  }
  LayoutAccessor fields = ctx.fields("counter");
  auto stored = fields.set_pubkey("authority", ctx.account("authority").key_copy());
  if (stored.is_err()) {
    return stored;
  }
  stored = fields.set_unsigned("bump", bump.value());
  if (stored.is_err()) {
    return stored;
  }
  return fields.set_unsigned("count", 0);
}

Result<bool> increment(Context &ctx) {
  auto count = ctx.fields("counter").get_unsigned("count");
  if (count.is_err()) {
    return Result<bool>(count.error());
  }
  if (count.value() == UINT64_MAX) {
    return fail(CounterError::COUNTER_OVERFLOW, "CounterOverflow");
  }
  return store_count(ctx, count.value() + 1);
}

Result<bool> set_count(Context &ctx) {
  auto value = ctx.args().get_u64("value");
  if (value.is_err()) {
    return Result<bool>(value.error());
  }
  if (value.value() > MAX_COUNT) {
    return fail(CounterError::MAX_COUNT_EXCEEDED, "MaxCountExceeded");
  }
  return store_count(ctx, value.value());
}

Result<bool> apply_action(Context &ctx) {
  auto action = ctx.args().get_variant("action");
  if (action.is_err()) {
    return Result<bool>(action.error());
  }
  auto count = ctx.fields("counter").get_unsigned("count");
  if (count.is_err()) {
    return Result<bool>(count.error());
  }

  const std::string &variant = action.value().first;
  LOG_DEBUG("counter", "Applying action ", variant, " to ", count.value());
  if (variant == "increment") {
    if (count.value() == UINT64_MAX) {
      return fail(CounterError::COUNTER_OVERFLOW, "CounterOverflow");
    }
    return store_count(ctx, count.value() + 1);
  }
  if (variant == "decrement") {
    if (count.value() == 0) {
      return fail(CounterError::COUNTER_UNDERFLOW, "CounterUnderflow");
    }
    return store_count(ctx, count.value() - 1);
  }
  if (variant == "set") {
    auto value = action.value().second.get_u64("value");
    if (value.is_err()) {
      return Result<bool>(value.error());
    }
    if (value.value() > MAX_COUNT) {
      return fail(CounterError::MAX_COUNT_EXCEEDED, "MaxCountExceeded");
    }
    return store_count(ctx, value.value());
  }
  return store_count(ctx, 0);
}

// Lamports and data are released by the close constraint after this returns
Result<bool> close(Context &ctx) {
  LOG_DEBUG("counter", "Closing counter ", to_hex(ctx.account("counter").key_copy()));
  return ok();
}

} // namespace

const common::PublicKey &program_id() {
  static const common::PublicKey id = program_id_from_label("counter");
  return id;
}

const DataLayout &counter_layout() {
  static const DataLayout layout = DataLayout("Counter").u64("count").pubkey("authority").u8("bump");
  return layout;
}

const DataLayout &initialize_args() {
  static const DataLayout layout = DataLayout().u8("bump");
  return layout;
}

const DataLayout &set_count_args() {
  static const DataLayout layout = DataLayout().u64("value");
  return layout;
}

const DataLayout &action_args() {
  static const DataLayout layout = DataLayout().tagged_union(
      "action", {{"increment", DataLayout()},
                 {"decrement", DataLayout()},
                 {"set", DataLayout().u64("value")},
                 {"reset", DataLayout()}});
  return layout;
}

std::optional<crypto::ProgramAddress> counter_address(const common::PublicKey &authority) {
  crypto::SeedList seeds;
  seeds.emplace_back(COUNTER_SEED, COUNTER_SEED + sizeof(COUNTER_SEED) - 1);
  seeds.emplace_back(authority.begin(), authority.end());
  return crypto::find_program_address(seeds, program_id());
}

const Program &program() {
  static const Program instance = [] {
    Program p(build_spec());
    p.on("initialize", initialize)
        .on("increment", increment)
        .on("set_count", set_count)
        .on("action", apply_action)
        .on("close", close);
    return p;
  }();
  return instance;
}

uint64_t entrypoint(uint8_t *input, uint64_t length, cpi::CallHost *host) {
  return program().entrypoint(input, length, host);
}

} // namespace counter
} // namespace examples
} // namespace keel
