#pragma once

#include "common/types.h"
#include "crypto/hashing.h"
#include <string>

namespace keel {
namespace examples {

/// Stable 32-byte program id derived from a label (example programs only)
inline common::PublicKey program_id_from_label(const std::string &label) {
  return crypto::sha256("keel-example:" + label);
}

} // namespace examples
} // namespace keel
