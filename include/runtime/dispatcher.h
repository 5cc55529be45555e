#pragma once

#include "runtime/schema.h"

namespace keel {
namespace runtime {

/**
 * @brief Select the instruction an incoming payload addresses
 *
 * SINGLE programs route everything to their only instruction without
 * looking at the payload. Otherwise the leading eight bytes must equal an
 * instruction discriminator; a shorter payload or an unknown tag fails with
 * UnknownInstruction.
 */
Result<const InstructionSpec *> dispatch(const uint8_t *payload, uint64_t length,
                                         const ProgramSpec &spec);

/// Bytes of the payload that hold the arguments (after the tag, if any)
size_t argument_offset(const ProgramSpec &spec);

} // namespace runtime
} // namespace keel
