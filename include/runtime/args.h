#pragma once

#include "common/types.h"
#include "runtime/data_layout.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace keel {
namespace runtime {

class ArgValues;

/// One decoded argument
struct ArgValue {
  FieldType type = FieldType::U8;
  uint64_t raw = 0;                      ///< Integers and bools (two's complement for signed)
  std::vector<uint8_t> bytes;            ///< PUBKEY and BYTES
  std::shared_ptr<const ArgValues> nested;  ///< STRUCT body, or ENUM variant body
  uint8_t tag = 0;                       ///< ENUM only
  std::string variant;                   ///< ENUM only
};

/**
 * @brief Named argument values of one instruction
 *
 * Produced by decode_args in declaration order; also filled by hand with the
 * setters to build payloads through encode_args.
 */
class ArgValues {
public:
  Result<uint64_t> get_u64(const std::string &name) const;
  Result<uint64_t> get_unsigned(const std::string &name) const;
  Result<uint8_t> get_u8(const std::string &name) const;
  Result<int64_t> get_signed(const std::string &name) const;
  Result<bool> get_bool(const std::string &name) const;
  Result<PublicKey> get_pubkey(const std::string &name) const;
  Result<std::vector<uint8_t>> get_bytes(const std::string &name) const;
  Result<ArgValues> get_struct(const std::string &name) const;

  /// Tag, variant name and variant fields of a tagged union
  Result<std::pair<std::string, ArgValues>> get_variant(const std::string &name) const;

  ArgValues &set_unsigned(const std::string &name, uint64_t value);
  ArgValues &set_signed(const std::string &name, int64_t value);
  ArgValues &set_bool(const std::string &name, bool value);
  ArgValues &set_pubkey(const std::string &name, const PublicKey &value);
  ArgValues &set_bytes(const std::string &name, std::vector<uint8_t> value);
  ArgValues &set_struct(const std::string &name, const ArgValues &value);
  ArgValues &set_variant(const std::string &name, uint8_t tag, const ArgValues &value);

  const ArgValue *find(const std::string &name) const;
  size_t size() const { return values_.size(); }
  bool empty() const { return values_.empty(); }

  void add(const std::string &name, ArgValue value);

private:
  ArgValue &slot(const std::string &name);

  std::vector<std::pair<std::string, ArgValue>> values_;
};

/**
 * @brief Decode a positional argument payload
 *
 * Fields are read in declaration order as fixed-width little-endian values.
 * A tagged union reads its u8 tag and then only the selected variant's
 * fields. Fails with ArgsDecodeError on short input, trailing bytes, an
 * unknown union tag or a bool byte other than 0 or 1.
 */
Result<ArgValues> decode_args(const DataLayout &layout, const uint8_t *data, size_t len);

/**
 * @brief Encode values in layout order
 *
 * Every declared field must be present with a compatible type; fails with
 * ArgsDecodeError otherwise.
 */
Result<std::vector<uint8_t>> encode_args(const DataLayout &layout, const ArgValues &values);

/// Instruction discriminator followed by the encoded arguments
Result<std::vector<uint8_t>> encode_instruction(const std::string &instruction,
                                                const DataLayout &layout,
                                                const ArgValues &values);

} // namespace runtime
} // namespace keel
