#include "runtime/data_layout.h"
#include "runtime/discriminator.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace keel {
namespace runtime {

const char *field_type_name(FieldType type) {
  switch (type) {
  case FieldType::U8: return "u8";
  case FieldType::U16: return "u16";
  case FieldType::U32: return "u32";
  case FieldType::U64: return "u64";
  case FieldType::I8: return "i8";
  case FieldType::I16: return "i16";
  case FieldType::I32: return "i32";
  case FieldType::I64: return "i64";
  case FieldType::BOOL: return "bool";
  case FieldType::PUBKEY: return "pubkey";
  case FieldType::BYTES: return "bytes";
  case FieldType::STRUCT: return "struct";
  case FieldType::ENUM: return "enum";
  }
  return "unknown";
}

DataLayout::DataLayout(std::string account_name)
    : account_name_(std::move(account_name)),
      discriminator_(account_discriminator(account_name_)) {}

DataLayout &DataLayout::add(const std::string &name, FieldType type, size_t size) {
  if (find(name) != nullptr) {
    throw std::invalid_argument("duplicate field name in layout: " + name);
  }
  Field field;
  field.name = name;
  field.type = type;
  field.offset = body_size_;
  field.size = size;
  fields_.push_back(std::move(field));
  body_size_ += size;
  return *this;
}

DataLayout &DataLayout::nested(const std::string &name, const DataLayout &layout) {
  if (layout.has_discriminator()) {
    throw std::invalid_argument("nested layout " + name + " cannot carry a discriminator");
  }
  add(name, FieldType::STRUCT, layout.body_size());
  fields_.back().nested = std::make_shared<const DataLayout>(layout);
  return *this;
}

DataLayout &DataLayout::tagged_union(
    const std::string &name, const std::vector<std::pair<std::string, DataLayout>> &variants) {
  if (variants.empty() || variants.size() > 256) {
    throw std::invalid_argument("tagged union " + name + " needs 1-256 variants");
  }

  size_t largest = 0;
  std::vector<Variant> table;
  table.reserve(variants.size());
  for (const auto &variant : variants) {
    largest = std::max(largest, variant.second.body_size());
    table.push_back({variant.first, std::make_shared<const DataLayout>(variant.second)});
  }

  add(name, FieldType::ENUM, 1 + largest);
  fields_.back().variants = std::move(table);
  return *this;
}

const Field *DataLayout::find(const std::string &name) const {
  for (const auto &field : fields_) {
    if (field.name == name) {
      return &field;
    }
  }
  return nullptr;
}

uint64_t read_le(const uint8_t *p, size_t size) {
  uint64_t value = 0;
  for (size_t i = 0; i < size; ++i) {
    value |= static_cast<uint64_t>(p[i]) << (8 * i);
  }
  return value;
}

void write_le(uint8_t *p, size_t size, uint64_t value) {
  for (size_t i = 0; i < size; ++i) {
    p[i] = static_cast<uint8_t>(value >> (8 * i));
  }
}

int64_t sign_extend(uint64_t raw, size_t size) {
  if (size >= 8) {
    return static_cast<int64_t>(raw);
  }
  const unsigned shift = static_cast<unsigned>(64 - 8 * size);
  return static_cast<int64_t>(raw << shift) >> shift;
}

namespace {

bool is_unsigned(FieldType type) {
  return type == FieldType::U8 || type == FieldType::U16 || type == FieldType::U32 ||
         type == FieldType::U64;
}

bool is_signed(FieldType type) {
  return type == FieldType::I8 || type == FieldType::I16 || type == FieldType::I32 ||
         type == FieldType::I64;
}

Error type_mismatch(const Field &field, const char *wanted) {
  return Error::invalid_input("field " + field.name + " is " + field_type_name(field.type) +
                              ", not " + wanted);
}

} // namespace

Result<const Field *> LayoutAccessor::locate(const std::string &name) const {
  const Field *field = layout_.find(name);
  if (field == nullptr) {
    return Result<const Field *>(Error::invalid_input("unknown field " + name));
  }
  if (layout_.prefix_size() + field->offset + field->size > len_) {
    return Result<const Field *>(
        Error::data_size_mismatch("account data too short for field " + name));
  }
  return Result<const Field *>(field);
}

Result<std::pair<uint8_t *, size_t>> LayoutAccessor::field_bytes(const std::string &name) const {
  auto field = locate(name);
  if (field.is_err()) {
    return Result<std::pair<uint8_t *, size_t>>(field.error());
  }
  uint8_t *p = data_ + layout_.prefix_size() + field.value()->offset;
  return Result<std::pair<uint8_t *, size_t>>(std::make_pair(p, field.value()->size));
}

Result<uint64_t> LayoutAccessor::get_unsigned(const std::string &name) const {
  auto field = locate(name);
  if (field.is_err()) {
    return Result<uint64_t>(field.error());
  }
  const Field &f = *field.value();
  if (!is_unsigned(f.type)) {
    return Result<uint64_t>(type_mismatch(f, "unsigned"));
  }
  return Result<uint64_t>(read_le(data_ + layout_.prefix_size() + f.offset, f.size));
}

Result<int64_t> LayoutAccessor::get_signed(const std::string &name) const {
  auto field = locate(name);
  if (field.is_err()) {
    return Result<int64_t>(field.error());
  }
  const Field &f = *field.value();
  if (!is_signed(f.type)) {
    return Result<int64_t>(type_mismatch(f, "signed"));
  }
  uint64_t raw = read_le(data_ + layout_.prefix_size() + f.offset, f.size);
  return Result<int64_t>(sign_extend(raw, f.size));
}

Result<bool> LayoutAccessor::get_bool(const std::string &name) const {
  auto field = locate(name);
  if (field.is_err()) {
    return Result<bool>(field.error());
  }
  const Field &f = *field.value();
  if (f.type != FieldType::BOOL) {
    return Result<bool>(type_mismatch(f, "bool"));
  }
  return Result<bool>(data_[layout_.prefix_size() + f.offset] != 0);
}

Result<PublicKey> LayoutAccessor::get_pubkey(const std::string &name) const {
  auto field = locate(name);
  if (field.is_err()) {
    return Result<PublicKey>(field.error());
  }
  const Field &f = *field.value();
  if (f.type != FieldType::PUBKEY) {
    return Result<PublicKey>(type_mismatch(f, "pubkey"));
  }
  PublicKey key;
  std::memcpy(key.data(), data_ + layout_.prefix_size() + f.offset, PUBKEY_BYTES);
  return Result<PublicKey>(key);
}

Result<bool> LayoutAccessor::set_unsigned(const std::string &name, uint64_t value) {
  auto field = locate(name);
  if (field.is_err()) {
    return Result<bool>(field.error());
  }
  const Field &f = *field.value();
  if (!is_unsigned(f.type)) {
    return Result<bool>(type_mismatch(f, "unsigned"));
  }
  write_le(data_ + layout_.prefix_size() + f.offset, f.size, value);
  return ok();
}

Result<bool> LayoutAccessor::set_signed(const std::string &name, int64_t value) {
  auto field = locate(name);
  if (field.is_err()) {
    return Result<bool>(field.error());
  }
  const Field &f = *field.value();
  if (!is_signed(f.type)) {
    return Result<bool>(type_mismatch(f, "signed"));
  }
  write_le(data_ + layout_.prefix_size() + f.offset, f.size, static_cast<uint64_t>(value));
  return ok();
}

Result<bool> LayoutAccessor::set_bool(const std::string &name, bool value) {
  auto field = locate(name);
  if (field.is_err()) {
    return Result<bool>(field.error());
  }
  const Field &f = *field.value();
  if (f.type != FieldType::BOOL) {
    return Result<bool>(type_mismatch(f, "bool"));
  }
  data_[layout_.prefix_size() + f.offset] = value ? 1 : 0;
  return ok();
}

Result<bool> LayoutAccessor::set_pubkey(const std::string &name, const PublicKey &value) {
  auto field = locate(name);
  if (field.is_err()) {
    return Result<bool>(field.error());
  }
  const Field &f = *field.value();
  if (f.type != FieldType::PUBKEY) {
    return Result<bool>(type_mismatch(f, "pubkey"));
  }
  std::memcpy(data_ + layout_.prefix_size() + f.offset, value.data(), PUBKEY_BYTES);
  return ok();
}

} // namespace runtime
} // namespace keel
