#include "common/types.h"

#include <iomanip>
#include <sstream>

namespace keel {
namespace common {

Error Error::invalid_input(std::string message) {
  return Error{ErrorCode::INVALID_INPUT, ConstraintKind::NONE, 0, std::move(message)};
}

Error Error::account_missing(std::string message) {
  return Error{ErrorCode::ACCOUNT_MISSING, ConstraintKind::NONE, 0, std::move(message)};
}

Error Error::data_size_mismatch(std::string message) {
  return Error{ErrorCode::DATA_SIZE_MISMATCH, ConstraintKind::NONE, 0, std::move(message)};
}

Error Error::constraint_violation(ConstraintKind kind, std::string message) {
  return Error{ErrorCode::CONSTRAINT_VIOLATION, kind, 0, std::move(message)};
}

Error Error::unknown_instruction(std::string message) {
  return Error{ErrorCode::UNKNOWN_INSTRUCTION, ConstraintKind::NONE, 0, std::move(message)};
}

Error Error::args_decode(std::string message) {
  return Error{ErrorCode::ARGS_DECODE_ERROR, ConstraintKind::NONE, 0, std::move(message)};
}

Error Error::invoke_failed(std::string message) {
  return Error{ErrorCode::INVOKE_FAILED, ConstraintKind::NONE, 0, std::move(message)};
}

Error Error::call_depth_exceeded(std::string message) {
  return Error{ErrorCode::CALL_DEPTH_EXCEEDED, ConstraintKind::NONE, 0, std::move(message)};
}

Error Error::custom(uint32_t code, std::string name) {
  return Error{ErrorCode::CUSTOM, ConstraintKind::NONE, code, std::move(name)};
}

std::string Error::to_string() const {
  std::ostringstream oss;
  oss << error_code_name(code);
  if (code == ErrorCode::CONSTRAINT_VIOLATION) {
    oss << "/" << constraint_kind_name(constraint);
  } else if (code == ErrorCode::CUSTOM) {
    oss << "(" << custom_code << ")";
  }
  if (!message.empty()) {
    oss << ": " << message;
  }
  return oss.str();
}

uint64_t to_status(const Error &error) {
  switch (error.code) {
  case ErrorCode::INVALID_INPUT:
    return 100;
  case ErrorCode::UNKNOWN_INSTRUCTION:
    return 101;
  case ErrorCode::ARGS_DECODE_ERROR:
    return 102;
  case ErrorCode::DATA_SIZE_MISMATCH:
    return 3003;
  case ErrorCode::ACCOUNT_MISSING:
    return 3005;
  case ErrorCode::INVOKE_FAILED:
    return 4100;
  case ErrorCode::CALL_DEPTH_EXCEEDED:
    return 4101;
  case ErrorCode::CUSTOM:
    return static_cast<uint64_t>(CUSTOM_ERROR_OFFSET) + error.custom_code;
  case ErrorCode::CONSTRAINT_VIOLATION:
    switch (error.constraint) {
    case ConstraintKind::WRITABLE:
      return 2000;
    case ConstraintKind::HAS_ONE:
      return 2001;
    case ConstraintKind::SIGNER:
      return 2002;
    case ConstraintKind::OWNER:
      return 2004;
    case ConstraintKind::SEEDS:
      return 2006;
    case ConstraintKind::ADDRESS:
      return 2012;
    case ConstraintKind::DISCRIMINATOR:
      return 3002;
    case ConstraintKind::NONE:
      break;
    }
    return 2003;
  }
  return 1;
}

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::INVALID_INPUT:
    return "InvalidInput";
  case ErrorCode::ACCOUNT_MISSING:
    return "AccountMissing";
  case ErrorCode::DATA_SIZE_MISMATCH:
    return "DataSizeMismatch";
  case ErrorCode::CONSTRAINT_VIOLATION:
    return "ConstraintViolation";
  case ErrorCode::UNKNOWN_INSTRUCTION:
    return "UnknownInstruction";
  case ErrorCode::ARGS_DECODE_ERROR:
    return "ArgsDecodeError";
  case ErrorCode::INVOKE_FAILED:
    return "InvokeFailed";
  case ErrorCode::CALL_DEPTH_EXCEEDED:
    return "CallDepthExceeded";
  case ErrorCode::CUSTOM:
    return "Custom";
  }
  return "Unknown";
}

const char *constraint_kind_name(ConstraintKind kind) {
  switch (kind) {
  case ConstraintKind::NONE:
    return "none";
  case ConstraintKind::SIGNER:
    return "signer";
  case ConstraintKind::WRITABLE:
    return "writable";
  case ConstraintKind::OWNER:
    return "owner";
  case ConstraintKind::ADDRESS:
    return "address";
  case ConstraintKind::DISCRIMINATOR:
    return "discriminator";
  case ConstraintKind::HAS_ONE:
    return "has_one";
  case ConstraintKind::SEEDS:
    return "seeds";
  }
  return "unknown";
}

std::string to_hex(const uint8_t *data, size_t len) {
  std::ostringstream oss;
  for (size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setfill('0') << std::setw(2)
        << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string to_hex(const PublicKey &key) { return to_hex(key.data(), key.size()); }

} // namespace common
} // namespace keel
