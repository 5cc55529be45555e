#include "runtime/program.h"
#include "common/logging.h"
#include "cpi/account_ops.h"
#include "cpi/system_program.h"
#include "runtime/buffer_decoder.h"
#include "runtime/dispatcher.h"

#include <cstring>
#include <stdexcept>

namespace keel {
namespace runtime {

Program::Program(ProgramSpec spec, RuntimeConfig config)
    : spec_(std::move(spec)), config_(std::move(config)) {}

Program &Program::on(const std::string &instruction, Handler handler) {
  if (spec_.find(instruction) == nullptr) {
    throw std::invalid_argument("no instruction named " + instruction);
  }
  handlers_[instruction] = std::move(handler);
  return *this;
}

cpi::Entrypoint Program::as_entrypoint() const {
  return [this](uint8_t *input, uint64_t length, cpi::CallHost *host) {
    return entrypoint(input, length, host);
  };
}

uint64_t Program::entrypoint(uint8_t *input, uint64_t length, cpi::CallHost *host) const {
  try {
    auto result = process(input, length, host);
    if (result.is_ok()) {
      return 0;
    }
    uint64_t status = to_status(result.error());
    LOG_WARN("program", "Call failed with status ", status, ": ", result.error().to_string());
    return status;
  } catch (const std::exception &e) {
    LOG_ERROR("program", "Call aborted by exception: ", e.what());
    return to_status(Error::invalid_input(e.what()));
  }
}

Result<Program::Located> Program::locate_fast(uint8_t *input) const {
  const InstructionSpec &first = spec_.instructions().front();
  Located located;
  located.data = first.offsets->instruction_data(input);
  located.data_len = first.offsets->instruction_data_len(input);
  located.program_id = first.offsets->program_id(input);

  auto instruction = dispatch(located.data, located.data_len, spec_);
  if (instruction.is_err()) {
    return Result<Located>(instruction.error());
  }
  located.instruction = instruction.value();
  located.accounts = first.offsets->bind(input);
  return Result<Located>(std::move(located));
}

Result<Program::Located> Program::locate_generic(uint8_t *input, uint64_t length) const {
  auto decoded = decode(input, length);
  if (decoded.is_err()) {
    return Result<Located>(decoded.error());
  }
  const DecodedInput &in = decoded.value();

  Located located;
  located.data = in.instruction_data;
  located.data_len = in.instruction_data_len;
  located.program_id = in.program_id;

  auto instruction = dispatch(located.data, located.data_len, spec_);
  if (instruction.is_err()) {
    return Result<Located>(instruction.error());
  }
  located.instruction = instruction.value();

  auto bound = bind(in, located.instruction->accounts);
  if (bound.is_err()) {
    return Result<Located>(bound.error());
  }
  located.accounts = bound.value();

  for (size_t i = located.instruction->accounts.size(); i < in.account_count(); ++i) {
    located.remaining.push_back(in.view(i));
  }
  return Result<Located>(std::move(located));
}

Result<bool> Program::process(uint8_t *input, uint64_t length, cpi::CallHost *host) const {
  const InstructionSpec &first = spec_.instructions().front();
  const bool fast = config_.prefer_fast_path && spec_.shape() != DispatchShape::PER_INSTRUCTION &&
                    first.offsets && first.offsets->matches(input, length);

  auto located = fast ? locate_fast(input) : locate_generic(input, length);
  if (located.is_err()) {
    return Result<bool>(located.error());
  }
  Located &call = located.value();
  const InstructionSpec &instruction = *call.instruction;

  if (std::memcmp(call.program_id, spec_.program_id().data(), PUBKEY_BYTES) != 0) {
    LOG_WARN("program", "Input addressed to ", to_hex(call.program_id, PUBKEY_BYTES),
             ", this program is ", to_hex(spec_.program_id()));
    return Result<bool>(Error::invalid_input("program id mismatch"));
  }

  size_t arg_offset = argument_offset(spec_);
  auto args = decode_args(instruction.args, call.data + arg_offset,
                          static_cast<size_t>(call.data_len - arg_offset));
  if (args.is_err()) {
    return Result<bool>(args.error());
  }

  Context ctx(spec_.program_id(), instruction, call.accounts, std::move(args).value(),
              std::move(call.remaining), host);

  Validator validator(spec_.program_id(), ctx.args());
  if (observer_) {
    validator.set_observer(observer_);
  }
  auto valid = validator.validate(instruction.accounts, ctx.accounts());
  if (valid.is_err()) {
    return valid;
  }

  auto created = create_init_accounts(instruction, ctx);
  if (created.is_err()) {
    return created;
  }

  auto handler = handlers_.find(instruction.name);
  if (handler == handlers_.end()) {
    LOG_ERROR("program", "No handler registered for ", instruction.name);
    return Result<bool>(Error::unknown_instruction("no handler for " + instruction.name));
  }

  LOG_DEBUG("program", "Executing ", instruction.name, fast ? " (fast path)" : "");
  auto handled = handler->second(ctx);
  if (handled.is_err()) {
    return handled;
  }

  return close_accounts(instruction, ctx);
}

Result<bool> Program::create_init_accounts(const InstructionSpec &instruction,
                                           Context &ctx) const {
  for (size_t i = 0; i < instruction.accounts.size(); ++i) {
    const AccountDescriptor &descriptor = instruction.accounts[i];
    if (!descriptor.is_init()) {
      continue;
    }

    AccountView &payer = ctx.account(descriptor.constraints.init->payer);
    AccountView &target = ctx.account(i);
    const uint64_t space = descriptor.init_space();
    const Lamports lamports = cpi::rent_exempt_minimum(space);

    auto call = cpi::system_program::create_account(payer.key_copy(), target.key_copy(), lamports,
                                                    space, spec_.program_id());

    Result<bool> invoked = ok();
    if (descriptor.constraints.seeds) {
      auto seeds = ctx.signer_seeds(descriptor.name);
      if (seeds.is_err()) {
        return Result<bool>(seeds.error());
      }
      invoked = ctx.invoke_signed(call, {payer, target}, {seeds.value()});
    } else {
      invoked = ctx.invoke(call, {payer, target});
    }
    if (invoked.is_err()) {
      LOG_WARN("program", "Creating account '", descriptor.name, "' failed");
      return invoked;
    }

    if (descriptor.layout) {
      auto written = cpi::write_discriminator(target, *descriptor.layout);
      if (written.is_err()) {
        return written;
      }
    }
    LOG_DEBUG("program", "Created account '", descriptor.name, "' with ", space, " bytes");
  }
  return ok();
}

Result<bool> Program::close_accounts(const InstructionSpec &instruction, Context &ctx) const {
  for (size_t i = 0; i < instruction.accounts.size(); ++i) {
    const AccountDescriptor &descriptor = instruction.accounts[i];
    if (!descriptor.constraints.close) {
      continue;
    }
    auto closed = cpi::close_account(ctx.account(i), ctx.account(*descriptor.constraints.close));
    if (closed.is_err()) {
      return closed;
    }
  }
  return ok();
}

} // namespace runtime
} // namespace keel
