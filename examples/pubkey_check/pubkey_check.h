#pragma once

#include "runtime/program.h"

namespace keel {
namespace examples {
namespace pubkey_check {

/// Single instruction, single account: succeeds only when key == owner
enum class PubkeyError : uint32_t { INVALID_KEY = 0 };

const common::PublicKey &program_id();
const runtime::Program &program();

uint64_t entrypoint(uint8_t *input, uint64_t length, cpi::CallHost *host);

} // namespace pubkey_check
} // namespace examples
} // namespace keel
