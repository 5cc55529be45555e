#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace keel {
namespace runtime {

constexpr size_t DISCRIMINATOR_SIZE = 8;

/// First eight bytes of SHA-256(namespace + ":" + name), as a little-endian u64
uint64_t discriminator(const std::string &name_space, const std::string &name);

/// Tag of an instruction payload: SHA-256("global:" + name)[0..8]
uint64_t instruction_discriminator(const std::string &name);

/// Tag of persisted account data: SHA-256("account:" + name)[0..8]
uint64_t account_discriminator(const std::string &name);

std::array<uint8_t, DISCRIMINATOR_SIZE> discriminator_bytes(uint64_t tag);

} // namespace runtime
} // namespace keel
