#pragma once

#include "runtime/program.h"

namespace keel {
namespace examples {
namespace lamport_transfer {

/// Moves lamports out of a program-owned source account
enum class TransferError : uint32_t { INSUFFICIENT_FUNDS = 0 };

const common::PublicKey &program_id();
const runtime::Program &program();

/// Argument layout: { amount: u64 }
const runtime::DataLayout &args_layout();

uint64_t entrypoint(uint8_t *input, uint64_t length, cpi::CallHost *host);

} // namespace lamport_transfer
} // namespace examples
} // namespace keel
