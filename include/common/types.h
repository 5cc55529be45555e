#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace keel {
namespace common {

/**
 * @file types.h
 * @brief Fundamental types and the error model shared by every keel module
 *
 * This header defines the key and balance types that appear in the call
 * buffer, the error taxonomy of the invocation pipeline, and the Result<T>
 * wrapper every fallible operation returns.
 */

/// @brief Number of bytes in an account key or program id
constexpr size_t PUBKEY_BYTES = 32;

/// @brief Ed25519 public key or derived address (32 bytes)
using PublicKey = std::array<uint8_t, PUBKEY_BYTES>;

/// @brief Native token amount in smallest unit
using Lamports = uint64_t;

/// @brief Epoch number stored in the trailing rent-epoch field
using Epoch = uint64_t;

/**
 * @brief Error categories surfaced by the invocation pipeline
 *
 * Every component reports the first failure it sees using one of these
 * codes. CUSTOM is reserved for errors raised by instruction handlers.
 */
enum class ErrorCode {
  INVALID_INPUT,
  ACCOUNT_MISSING,
  DATA_SIZE_MISMATCH,
  CONSTRAINT_VIOLATION,
  UNKNOWN_INSTRUCTION,
  ARGS_DECODE_ERROR,
  INVOKE_FAILED,
  CALL_DEPTH_EXCEEDED,
  CUSTOM
};

/// @brief Which declared constraint failed (only set for CONSTRAINT_VIOLATION)
enum class ConstraintKind {
  NONE,
  SIGNER,
  WRITABLE,
  OWNER,
  ADDRESS,
  DISCRIMINATOR,
  HAS_ONE,
  SEEDS
};

/// @brief Offset added to handler error numbers when forming a status code
constexpr uint32_t CUSTOM_ERROR_OFFSET = 6000;

/**
 * @brief Structured error value carried by a failed Result
 *
 * The numeric status returned through the entrypoint is derived from
 * code/constraint/custom_code; the message only feeds diagnostic logs.
 */
struct Error {
  ErrorCode code = ErrorCode::INVALID_INPUT;
  ConstraintKind constraint = ConstraintKind::NONE;
  uint32_t custom_code = 0;  ///< Handler-defined error number (CUSTOM only)
  std::string message;

  static Error invalid_input(std::string message);
  static Error account_missing(std::string message);
  static Error data_size_mismatch(std::string message);
  static Error constraint_violation(ConstraintKind kind, std::string message);
  static Error unknown_instruction(std::string message);
  static Error args_decode(std::string message);
  static Error invoke_failed(std::string message);
  static Error call_depth_exceeded(std::string message);

  /**
   * @brief Handler-defined error
   * @param code Error number relative to CUSTOM_ERROR_OFFSET
   * @param name Short name used in logs (e.g. "InsufficientFunds")
   */
  static Error custom(uint32_t code, std::string name);

  /// Human readable "<code>[/<constraint>]: <message>"
  std::string to_string() const;
};

/// @brief Non-zero status code for an error; 0 is reserved for success
uint64_t to_status(const Error &error);

const char *error_code_name(ErrorCode code);
const char *constraint_kind_name(ConstraintKind kind);

/**
 * @brief Type-safe result wrapper for operations that can fail
 *
 * Holds either a success value or an Error. Operations with nothing to
 * return use Result<bool>.
 *
 * @tparam T The type of the success value
 *
 * Example usage:
 * @code
 * auto decoded = runtime::decode(input, length);
 * if (decoded.is_err()) {
 *     return to_status(decoded.error());
 * }
 * @endcode
 */
template <typename T>
class Result {
private:
  bool success_;
  T value_;
  Error error_;

public:
  /**
   * @brief Construct a successful result with a value
   * @param value The success value to store
   */
  explicit Result(T value) : success_(true), value_(std::move(value)) {}

  /**
   * @brief Construct a failed result
   * @param error Error describing the failure
   */
  explicit Result(Error error) : success_(false), value_(), error_(std::move(error)) {}

  Result(const Result &other) = default;
  Result(Result &&other) = default;
  Result &operator=(const Result &other) = default;
  Result &operator=(Result &&other) = default;

  bool is_ok() const noexcept { return success_; }
  bool is_err() const noexcept { return !success_; }

  /**
   * @brief Get the success value (lvalue reference)
   * @warning Only call this if is_ok() returns true
   */
  const T &value() const & { return value_; }

  /// Mutable access to the success value
  T &value() & { return value_; }

  /// Rvalue access for move semantics
  T &&value() && { return std::move(value_); }

  /**
   * @brief Get the error
   * @warning Only call this if is_err() returns true
   */
  const Error &error() const noexcept { return error_; }

  explicit operator bool() const noexcept { return success_; }

  T value_or(const T &default_value) const {
    return success_ ? value_ : default_value;
  }
};

/// @brief Successful Result<bool>
inline Result<bool> ok() { return Result<bool>(true); }

/// @brief Hash functor so PublicKey can key unordered containers
struct PublicKeyHash {
  size_t operator()(const PublicKey &key) const noexcept {
    size_t seed = key.size();
    for (const auto &byte : key) {
      seed ^= byte + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
  }
};

/// @brief Lowercase hex rendering used by logs and test failure messages
std::string to_hex(const uint8_t *data, size_t len);
std::string to_hex(const PublicKey &key);

} // namespace common
} // namespace keel
