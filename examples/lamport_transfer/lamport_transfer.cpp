#include "lamport_transfer/lamport_transfer.h"
#include "common/example_ids.h"
#include "common/logging.h"
#include "cpi/account_ops.h"

namespace keel {
namespace examples {
namespace lamport_transfer {

using namespace keel::runtime;

const common::PublicKey &program_id() {
  static const common::PublicKey id = program_id_from_label("lamport_transfer");
  return id;
}

const DataLayout &args_layout() {
  static const DataLayout layout = DataLayout().u64("amount");
  return layout;
}

namespace {

ProgramSpec build_spec() {
  InstructionSpec transfer(
      "transfer",
      {mut("source").owned_by(program_id()).sized(0), mut("destination").sized(0)},
      args_layout());
  return ProgramSpec(program_id(), DispatchShape::SINGLE, {transfer});
}

Result<bool> transfer(Context &ctx) {
  auto amount = ctx.args().get_u64("amount");
  if (amount.is_err()) {
    return Result<bool>(amount.error());
  }

  AccountView &source = ctx.account("source");
  AccountView &destination = ctx.account("destination");
  if (source.lamports() < amount.value()) {
    LOG_DEBUG("lamport_transfer", "Balance ", source.lamports(), " below ", amount.value());
    return Result<bool>(Error::custom(
        static_cast<uint32_t>(TransferError::INSUFFICIENT_FUNDS), "InsufficientFunds"));
  }
  return cpi::transfer_lamports(source, destination, amount.value());
}

} // namespace

const Program &program() {
  static const Program instance = [] {
    Program p(build_spec());
    p.on("transfer", transfer);
    return p;
  }();
  return instance;
}

uint64_t entrypoint(uint8_t *input, uint64_t length, cpi::CallHost *host) {
  return program().entrypoint(input, length, host);
}

} // namespace lamport_transfer
} // namespace examples
} // namespace keel
