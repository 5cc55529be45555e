#include "runtime/args.h"
#include "common/logging.h"
#include "runtime/discriminator.h"

#include <cstdint>
#include <cstring>

namespace keel {
namespace runtime {

namespace {

bool is_integer(FieldType type) {
  switch (type) {
  case FieldType::U8:
  case FieldType::U16:
  case FieldType::U32:
  case FieldType::U64:
  case FieldType::I8:
  case FieldType::I16:
  case FieldType::I32:
  case FieldType::I64:
    return true;
  default:
    return false;
  }
}

bool is_signed_type(FieldType type) {
  return type == FieldType::I8 || type == FieldType::I16 || type == FieldType::I32 ||
         type == FieldType::I64;
}

Error missing(const std::string &name) {
  return Error::args_decode("argument " + name + " is not present");
}

// Integer value representable in the field's width and signedness
bool fits_width(const Field &field, const ArgValue &value) {
  const unsigned bits = static_cast<unsigned>(field.size * 8);
  const bool value_signed = is_signed_type(value.type);
  const int64_t as_signed = static_cast<int64_t>(value.raw);
  if (is_signed_type(field.type)) {
    if (!value_signed && value.raw > static_cast<uint64_t>(INT64_MAX)) {
      return false;
    }
    if (bits >= 64) {
      return true;
    }
    const int64_t limit = int64_t{1} << (bits - 1);
    return as_signed >= -limit && as_signed < limit;
  }
  if (value_signed && as_signed < 0) {
    return false;
  }
  return bits >= 64 || value.raw <= (uint64_t{1} << bits) - 1;
}

Error wrong_type(const std::string &name, const ArgValue &value, const char *wanted) {
  return Error::args_decode("argument " + name + " is " + field_type_name(value.type) +
                            ", not " + wanted);
}

// Decoding

class Reader {
public:
  Reader(const uint8_t *data, size_t len) : data_(data), len_(len) {}

  bool take(size_t n, const uint8_t *&out) {
    if (len_ - pos_ < n) {
      return false;
    }
    out = data_ + pos_;
    pos_ += n;
    return true;
  }

  size_t remaining() const { return len_ - pos_; }

private:
  const uint8_t *data_;
  size_t len_;
  size_t pos_ = 0;
};

Result<ArgValues> decode_fields(const DataLayout &layout, Reader &reader);

Result<ArgValue> decode_field(const Field &field, Reader &reader) {
  ArgValue value;
  value.type = field.type;
  const uint8_t *p = nullptr;

  switch (field.type) {
  case FieldType::STRUCT: {
    auto body = decode_fields(*field.nested, reader);
    if (body.is_err()) {
      return Result<ArgValue>(body.error());
    }
    value.nested = std::make_shared<const ArgValues>(std::move(body).value());
    return Result<ArgValue>(std::move(value));
  }
  case FieldType::ENUM: {
    if (!reader.take(1, p)) {
      return Result<ArgValue>(Error::args_decode("missing tag of " + field.name));
    }
    if (*p >= field.variants.size()) {
      return Result<ArgValue>(Error::args_decode("unknown tag " + std::to_string(*p) + " for " +
                                                 field.name));
    }
    const Variant &variant = field.variants[*p];
    value.tag = *p;
    value.variant = variant.name;
    auto body = decode_fields(*variant.layout, reader);
    if (body.is_err()) {
      return Result<ArgValue>(body.error());
    }
    value.nested = std::make_shared<const ArgValues>(std::move(body).value());
    return Result<ArgValue>(std::move(value));
  }
  default:
    break;
  }

  if (!reader.take(field.size, p)) {
    return Result<ArgValue>(Error::args_decode("payload ends inside " + field.name));
  }

  if (field.type == FieldType::PUBKEY || field.type == FieldType::BYTES) {
    value.bytes.assign(p, p + field.size);
  } else if (field.type == FieldType::BOOL) {
    if (*p > 1) {
      return Result<ArgValue>(Error::args_decode("invalid bool byte in " + field.name));
    }
    value.raw = *p;
  } else {
    value.raw = read_le(p, field.size);
    if (is_signed_type(field.type)) {
      value.raw = static_cast<uint64_t>(sign_extend(value.raw, field.size));
    }
  }
  return Result<ArgValue>(std::move(value));
}

Result<ArgValues> decode_fields(const DataLayout &layout, Reader &reader) {
  ArgValues values;
  for (const auto &field : layout.fields()) {
    auto value = decode_field(field, reader);
    if (value.is_err()) {
      return Result<ArgValues>(value.error());
    }
    values.add(field.name, std::move(value).value());
  }
  return Result<ArgValues>(std::move(values));
}

// Encoding

Result<bool> encode_fields(const DataLayout &layout, const ArgValues &values,
                           std::vector<uint8_t> &out);

Result<bool> encode_field(const Field &field, const ArgValue &value, std::vector<uint8_t> &out) {
  switch (field.type) {
  case FieldType::STRUCT:
    if (value.type != FieldType::STRUCT || !value.nested) {
      return Result<bool>(wrong_type(field.name, value, "struct"));
    }
    return encode_fields(*field.nested, *value.nested, out);

  case FieldType::ENUM:
    if (value.type != FieldType::ENUM || !value.nested) {
      return Result<bool>(wrong_type(field.name, value, "enum"));
    }
    if (value.tag >= field.variants.size()) {
      return Result<bool>(Error::args_decode("unknown tag for " + field.name));
    }
    out.push_back(value.tag);
    return encode_fields(*field.variants[value.tag].layout, *value.nested, out);

  case FieldType::PUBKEY:
  case FieldType::BYTES:
    if ((value.type != FieldType::PUBKEY && value.type != FieldType::BYTES) ||
        value.bytes.size() != field.size) {
      return Result<bool>(Error::args_decode("argument " + field.name + " needs " +
                                             std::to_string(field.size) + " bytes"));
    }
    out.insert(out.end(), value.bytes.begin(), value.bytes.end());
    return ok();

  case FieldType::BOOL:
    if (value.type != FieldType::BOOL) {
      return Result<bool>(wrong_type(field.name, value, "bool"));
    }
    out.push_back(value.raw ? 1 : 0);
    return ok();

  default: {
    if (!is_integer(value.type)) {
      return Result<bool>(wrong_type(field.name, value, field_type_name(field.type)));
    }
    if (!fits_width(field, value)) {
      return Result<bool>(Error::args_decode("argument " + field.name + " does not fit in " +
                                             field_type_name(field.type)));
    }
    size_t at = out.size();
    out.resize(at + field.size);
    write_le(out.data() + at, field.size, value.raw);
    return ok();
  }
  }
}

Result<bool> encode_fields(const DataLayout &layout, const ArgValues &values,
                           std::vector<uint8_t> &out) {
  for (const auto &field : layout.fields()) {
    const ArgValue *value = values.find(field.name);
    if (value == nullptr) {
      return Result<bool>(missing(field.name));
    }
    auto written = encode_field(field, *value, out);
    if (written.is_err()) {
      return written;
    }
  }
  return ok();
}

} // namespace

// ArgValues

const ArgValue *ArgValues::find(const std::string &name) const {
  for (const auto &entry : values_) {
    if (entry.first == name) {
      return &entry.second;
    }
  }
  return nullptr;
}

void ArgValues::add(const std::string &name, ArgValue value) {
  slot(name) = std::move(value);
}

ArgValue &ArgValues::slot(const std::string &name) {
  for (auto &entry : values_) {
    if (entry.first == name) {
      return entry.second;
    }
  }
  values_.emplace_back(name, ArgValue());
  return values_.back().second;
}

Result<uint64_t> ArgValues::get_unsigned(const std::string &name) const {
  const ArgValue *value = find(name);
  if (value == nullptr) {
    return Result<uint64_t>(missing(name));
  }
  if (!is_integer(value->type) || is_signed_type(value->type)) {
    return Result<uint64_t>(wrong_type(name, *value, "unsigned"));
  }
  return Result<uint64_t>(value->raw);
}

Result<uint64_t> ArgValues::get_u64(const std::string &name) const {
  return get_unsigned(name);
}

Result<uint8_t> ArgValues::get_u8(const std::string &name) const {
  const ArgValue *value = find(name);
  if (value == nullptr) {
    return Result<uint8_t>(missing(name));
  }
  if (value->type != FieldType::U8) {
    return Result<uint8_t>(wrong_type(name, *value, "u8"));
  }
  return Result<uint8_t>(static_cast<uint8_t>(value->raw));
}

Result<int64_t> ArgValues::get_signed(const std::string &name) const {
  const ArgValue *value = find(name);
  if (value == nullptr) {
    return Result<int64_t>(missing(name));
  }
  if (!is_signed_type(value->type)) {
    return Result<int64_t>(wrong_type(name, *value, "signed"));
  }
  return Result<int64_t>(static_cast<int64_t>(value->raw));
}

Result<bool> ArgValues::get_bool(const std::string &name) const {
  const ArgValue *value = find(name);
  if (value == nullptr) {
    return Result<bool>(missing(name));
  }
  if (value->type != FieldType::BOOL) {
    return Result<bool>(wrong_type(name, *value, "bool"));
  }
  return Result<bool>(value->raw != 0);
}

Result<PublicKey> ArgValues::get_pubkey(const std::string &name) const {
  const ArgValue *value = find(name);
  if (value == nullptr) {
    return Result<PublicKey>(missing(name));
  }
  if (value->type != FieldType::PUBKEY || value->bytes.size() != PUBKEY_BYTES) {
    return Result<PublicKey>(wrong_type(name, *value, "pubkey"));
  }
  PublicKey key;
  std::memcpy(key.data(), value->bytes.data(), PUBKEY_BYTES);
  return Result<PublicKey>(key);
}

Result<std::vector<uint8_t>> ArgValues::get_bytes(const std::string &name) const {
  const ArgValue *value = find(name);
  if (value == nullptr) {
    return Result<std::vector<uint8_t>>(missing(name));
  }
  if (value->type != FieldType::BYTES && value->type != FieldType::PUBKEY) {
    return Result<std::vector<uint8_t>>(wrong_type(name, *value, "bytes"));
  }
  return Result<std::vector<uint8_t>>(value->bytes);
}

Result<ArgValues> ArgValues::get_struct(const std::string &name) const {
  const ArgValue *value = find(name);
  if (value == nullptr) {
    return Result<ArgValues>(missing(name));
  }
  if (value->type != FieldType::STRUCT || !value->nested) {
    return Result<ArgValues>(wrong_type(name, *value, "struct"));
  }
  return Result<ArgValues>(*value->nested);
}

Result<std::pair<std::string, ArgValues>> ArgValues::get_variant(const std::string &name) const {
  using VariantResult = Result<std::pair<std::string, ArgValues>>;
  const ArgValue *value = find(name);
  if (value == nullptr) {
    return VariantResult(missing(name));
  }
  if (value->type != FieldType::ENUM || !value->nested) {
    return VariantResult(wrong_type(name, *value, "enum"));
  }
  return VariantResult(std::make_pair(value->variant, *value->nested));
}

ArgValues &ArgValues::set_unsigned(const std::string &name, uint64_t value) {
  ArgValue &v = slot(name);
  v.type = FieldType::U64;
  v.raw = value;
  return *this;
}

ArgValues &ArgValues::set_signed(const std::string &name, int64_t value) {
  ArgValue &v = slot(name);
  v.type = FieldType::I64;
  v.raw = static_cast<uint64_t>(value);
  return *this;
}

ArgValues &ArgValues::set_bool(const std::string &name, bool value) {
  ArgValue &v = slot(name);
  v.type = FieldType::BOOL;
  v.raw = value ? 1 : 0;
  return *this;
}

ArgValues &ArgValues::set_pubkey(const std::string &name, const PublicKey &value) {
  ArgValue &v = slot(name);
  v.type = FieldType::PUBKEY;
  v.bytes.assign(value.begin(), value.end());
  return *this;
}

ArgValues &ArgValues::set_bytes(const std::string &name, std::vector<uint8_t> value) {
  ArgValue &v = slot(name);
  v.type = FieldType::BYTES;
  v.bytes = std::move(value);
  return *this;
}

ArgValues &ArgValues::set_struct(const std::string &name, const ArgValues &value) {
  ArgValue &v = slot(name);
  v.type = FieldType::STRUCT;
  v.nested = std::make_shared<const ArgValues>(value);
  return *this;
}

ArgValues &ArgValues::set_variant(const std::string &name, uint8_t tag, const ArgValues &value) {
  ArgValue &v = slot(name);
  v.type = FieldType::ENUM;
  v.tag = tag;
  v.nested = std::make_shared<const ArgValues>(value);
  return *this;
}

// Codec

Result<ArgValues> decode_args(const DataLayout &layout, const uint8_t *data, size_t len) {
  Reader reader(data, len);
  auto values = decode_fields(layout, reader);
  if (values.is_err()) {
    LOG_WARN("args", "Argument decoding failed: ", values.error().message);
    return values;
  }
  if (reader.remaining() != 0) {
    LOG_WARN("args", "Argument payload has ", reader.remaining(), " trailing bytes");
    return Result<ArgValues>(Error::args_decode("trailing bytes after arguments"));
  }
  return values;
}

Result<std::vector<uint8_t>> encode_args(const DataLayout &layout, const ArgValues &values) {
  std::vector<uint8_t> out;
  out.reserve(layout.body_size());
  auto written = encode_fields(layout, values, out);
  if (written.is_err()) {
    return Result<std::vector<uint8_t>>(written.error());
  }
  return Result<std::vector<uint8_t>>(std::move(out));
}

Result<std::vector<uint8_t>> encode_instruction(const std::string &instruction,
                                                const DataLayout &layout,
                                                const ArgValues &values) {
  auto body = encode_args(layout, values);
  if (body.is_err()) {
    return body;
  }
  auto tag = discriminator_bytes(instruction_discriminator(instruction));
  std::vector<uint8_t> out(tag.begin(), tag.end());
  out.insert(out.end(), body.value().begin(), body.value().end());
  return Result<std::vector<uint8_t>>(std::move(out));
}

} // namespace runtime
} // namespace keel
