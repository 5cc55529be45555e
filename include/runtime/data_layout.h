#pragma once

#include "common/types.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace keel {
namespace runtime {

using namespace keel::common;

/// Primitive and composite field kinds of a fixed layout
enum class FieldType {
  U8,
  U16,
  U32,
  U64,
  I8,
  I16,
  I32,
  I64,
  BOOL,
  PUBKEY,
  BYTES,   ///< Fixed-length byte array
  STRUCT,  ///< Nested fixed layout
  ENUM     ///< u8 tag followed by the selected variant's fields
};

const char *field_type_name(FieldType type);

class DataLayout;
using LayoutPtr = std::shared_ptr<const DataLayout>;

struct Variant {
  std::string name;
  LayoutPtr layout;
};

/**
 * @brief One named field of a layout
 *
 * `offset` is relative to the start of the layout's bytes (after the
 * account discriminator when the layout has one). An ENUM occupies the tag
 * plus its largest variant when stored in account data.
 */
struct Field {
  std::string name;
  FieldType type = FieldType::U8;
  size_t offset = 0;
  size_t size = 0;
  LayoutPtr nested;               ///< STRUCT only
  std::vector<Variant> variants;  ///< ENUM only, indexed by tag
};

/**
 * @brief Declared byte layout of account data or instruction arguments
 *
 * Built once with the chained adders and then treated as immutable. A
 * layout constructed with an account name is prefixed in account data by
 * account_discriminator(name).
 */
class DataLayout {
public:
  DataLayout() = default;
  explicit DataLayout(std::string account_name);

  DataLayout &u8(const std::string &name) { return add(name, FieldType::U8, 1); }
  DataLayout &u16(const std::string &name) { return add(name, FieldType::U16, 2); }
  DataLayout &u32(const std::string &name) { return add(name, FieldType::U32, 4); }
  DataLayout &u64(const std::string &name) { return add(name, FieldType::U64, 8); }
  DataLayout &i8(const std::string &name) { return add(name, FieldType::I8, 1); }
  DataLayout &i16(const std::string &name) { return add(name, FieldType::I16, 2); }
  DataLayout &i32(const std::string &name) { return add(name, FieldType::I32, 4); }
  DataLayout &i64(const std::string &name) { return add(name, FieldType::I64, 8); }
  DataLayout &boolean(const std::string &name) { return add(name, FieldType::BOOL, 1); }
  DataLayout &pubkey(const std::string &name) { return add(name, FieldType::PUBKEY, PUBKEY_BYTES); }
  DataLayout &bytes(const std::string &name, size_t len) { return add(name, FieldType::BYTES, len); }
  DataLayout &nested(const std::string &name, const DataLayout &layout);
  DataLayout &tagged_union(const std::string &name,
                           const std::vector<std::pair<std::string, DataLayout>> &variants);

  /// Bytes of the fields alone
  size_t body_size() const { return body_size_; }

  /// Bytes occupied in account data, discriminator included
  size_t size() const { return prefix_size() + body_size_; }

  size_t prefix_size() const { return account_name_.empty() ? 0 : 8; }

  bool has_discriminator() const { return !account_name_.empty(); }
  const std::string &account_name() const { return account_name_; }
  uint64_t discriminator() const { return discriminator_; }

  const std::vector<Field> &fields() const { return fields_; }
  const Field *find(const std::string &name) const;

  bool empty() const { return fields_.empty(); }

private:
  DataLayout &add(const std::string &name, FieldType type, size_t size);

  std::string account_name_;
  uint64_t discriminator_ = 0;
  std::vector<Field> fields_;
  size_t body_size_ = 0;
};

/**
 * @brief Typed access to a layout's fields inside account data
 *
 * Wraps the data slice of an account (discriminator included). Unknown field
 * names or type mismatches fail with InvalidInput.
 */
class LayoutAccessor {
public:
  LayoutAccessor(const DataLayout &layout, uint8_t *data, size_t len)
      : layout_(layout), data_(data), len_(len) {}

  Result<uint64_t> get_unsigned(const std::string &name) const;
  Result<int64_t> get_signed(const std::string &name) const;
  Result<bool> get_bool(const std::string &name) const;
  Result<PublicKey> get_pubkey(const std::string &name) const;

  Result<bool> set_unsigned(const std::string &name, uint64_t value);
  Result<bool> set_signed(const std::string &name, int64_t value);
  Result<bool> set_bool(const std::string &name, bool value);
  Result<bool> set_pubkey(const std::string &name, const PublicKey &value);

  /// Raw bytes of a field (any type)
  Result<std::pair<uint8_t *, size_t>> field_bytes(const std::string &name) const;

private:
  Result<const Field *> locate(const std::string &name) const;

  const DataLayout &layout_;
  uint8_t *data_;
  size_t len_;
};

/// Little-endian integer read of 1, 2, 4 or 8 bytes
uint64_t read_le(const uint8_t *p, size_t size);
void write_le(uint8_t *p, size_t size, uint64_t value);

/// Sign-extend an integer field of the given width
int64_t sign_extend(uint64_t raw, size_t size);

} // namespace runtime
} // namespace keel
