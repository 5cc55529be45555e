#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace keel {
namespace runtime {

/**
 * @file wire_format.h
 * @brief Byte layout of the serialized program input (BPF loader ABI)
 *
 *   count:u64
 *   record*          (full record, or 8-byte duplicate reference)
 *   pad to 8
 *   data_len:u64
 *   data[data_len]
 *   program_id[32]
 *
 * Full record:
 *   0  dup marker (0xFF)    1 is_signer    2 is_writable    3 is_executable
 *   4  padding[4]           8 key[32]      40 owner[32]     72 lamports:u64
 *   80 data_len:u64         88 data[data_len] + growth region, pad to 8
 *   .. rent_epoch:u64
 */
namespace wire {

constexpr uint8_t NON_DUP_MARKER = 0xFF;

constexpr size_t COUNT_SIZE = 8;
constexpr size_t DUP_RECORD_SIZE = 8;

constexpr size_t OFF_DUP = 0;
constexpr size_t OFF_IS_SIGNER = 1;
constexpr size_t OFF_IS_WRITABLE = 2;
constexpr size_t OFF_IS_EXECUTABLE = 3;
constexpr size_t OFF_KEY = 8;
constexpr size_t OFF_OWNER = 40;
constexpr size_t OFF_LAMPORTS = 72;
constexpr size_t OFF_DATA_LEN = 80;
constexpr size_t HEADER_SIZE = 88;

/// Space reserved after account data for in-place reallocation
constexpr size_t MAX_PERMITTED_DATA_INCREASE = 10 * 1024;

constexpr size_t RENT_EPOCH_SIZE = 8;
constexpr size_t PROGRAM_ID_SIZE = 32;

/// Upper bound on a single account's data length
constexpr uint64_t MAX_PERMITTED_DATA_LENGTH = 10 * 1024 * 1024;

constexpr size_t align8(size_t n) { return (n + 7) & ~static_cast<size_t>(7); }

/// Offset of rent_epoch relative to the record start
constexpr size_t rent_epoch_offset(size_t data_len) {
  return align8(HEADER_SIZE + data_len + MAX_PERMITTED_DATA_INCREASE);
}

/// Total size of a non-duplicate record
constexpr size_t record_size(size_t data_len) {
  return rent_epoch_offset(data_len) + RENT_EPOCH_SIZE;
}

// Unaligned little-endian access. memcpy compiles to a single load/store on
// the targets this runs on.
inline uint64_t load_u64(const uint8_t *p) {
  uint64_t v;
  std::memcpy(&v, p, sizeof(v));
  return v;
}

inline void store_u64(uint8_t *p, uint64_t v) { std::memcpy(p, &v, sizeof(v)); }

inline uint32_t load_u32(const uint8_t *p) {
  uint32_t v;
  std::memcpy(&v, p, sizeof(v));
  return v;
}

inline void store_u32(uint8_t *p, uint32_t v) { std::memcpy(p, &v, sizeof(v)); }

inline uint16_t load_u16(const uint8_t *p) {
  uint16_t v;
  std::memcpy(&v, p, sizeof(v));
  return v;
}

inline void store_u16(uint8_t *p, uint16_t v) { std::memcpy(p, &v, sizeof(v)); }

} // namespace wire
} // namespace runtime
} // namespace keel
