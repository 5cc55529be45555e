#pragma once

#include "cpi/call.h"

namespace keel {
namespace host {

/// Error numbers of the builtin system program (status = 6000 + n)
enum class SystemError : uint32_t {
  ACCOUNT_ALREADY_IN_USE = 0,
  RESULT_WITH_NEGATIVE_LAMPORTS = 1,
  INVALID_PROGRAM_ID = 2,
  INVALID_ACCOUNT_DATA_LENGTH = 3,
  MISSING_REQUIRED_SIGNATURE = 4,
  INVALID_INSTRUCTION_DATA = 5,
  NOT_ENOUGH_ACCOUNT_KEYS = 6
};

/**
 * @brief Entrypoint of the builtin system program
 *
 * Supports CreateAccount, Assign, Transfer and Allocate on system-owned
 * accounts, reading the same serialized input any program receives.
 */
uint64_t system_program_entrypoint(uint8_t *input, uint64_t length, cpi::CallHost *host);

} // namespace host
} // namespace keel
