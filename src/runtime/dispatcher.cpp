#include "runtime/dispatcher.h"
#include "common/logging.h"
#include "runtime/discriminator.h"
#include "runtime/wire_format.h"

namespace keel {
namespace runtime {

Result<const InstructionSpec *> dispatch(const uint8_t *payload, uint64_t length,
                                         const ProgramSpec &spec) {
  if (spec.shape() == DispatchShape::SINGLE) {
    return Result<const InstructionSpec *>(&spec.instructions().front());
  }

  if (length < DISCRIMINATOR_SIZE) {
    LOG_WARN("dispatcher", "Payload of ", length, " bytes carries no instruction tag");
    return Result<const InstructionSpec *>(
        Error::unknown_instruction("payload shorter than the instruction tag"));
  }

  uint64_t tag = wire::load_u64(payload);
  const InstructionSpec *ix = spec.find_by_discriminator(tag);
  if (ix == nullptr) {
    LOG_WARN("dispatcher", "No instruction with tag ", to_hex(payload, DISCRIMINATOR_SIZE));
    return Result<const InstructionSpec *>(
        Error::unknown_instruction("unknown tag " + to_hex(payload, DISCRIMINATOR_SIZE)));
  }

  LOG_TRACE("dispatcher", "Routed to ", ix->name);
  return Result<const InstructionSpec *>(ix);
}

size_t argument_offset(const ProgramSpec &spec) {
  return spec.shape() == DispatchShape::SINGLE ? 0 : DISCRIMINATOR_SIZE;
}

} // namespace runtime
} // namespace keel
