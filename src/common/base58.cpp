#include "common/base58.h"
#include <algorithm>

namespace keel {
namespace common {

namespace {

const char BASE58_ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int base58_digit(char c) {
  static const std::vector<int> table = [] {
    std::vector<int> map(256, -1);
    for (int i = 0; i < 58; ++i) {
      map[static_cast<unsigned char>(BASE58_ALPHABET[i])] = i;
    }
    return map;
  }();
  return table[static_cast<unsigned char>(c)];
}

} // namespace

std::string encode_base58(const uint8_t *data, size_t len) {
  // Little-endian base-58 digits of the big-endian input number
  std::vector<uint8_t> digits(1, 0);

  for (size_t i = 0; i < len; ++i) {
    uint32_t carry = data[i];
    for (size_t j = 0; j < digits.size(); ++j) {
      carry += static_cast<uint32_t>(digits[j]) << 8;
      digits[j] = carry % 58;
      carry /= 58;
    }

    while (carry > 0) {
      digits.push_back(carry % 58);
      carry /= 58;
    }
  }

  std::string result;
  for (size_t i = 0; i < len && data[i] == 0; ++i) {
    result += BASE58_ALPHABET[0];
  }

  // The seed digit is a spurious zero unless the number itself is non-zero
  while (digits.size() > 1 && digits.back() == 0) {
    digits.pop_back();
  }
  bool all_zero = std::all_of(data, data + len, [](uint8_t b) { return b == 0; });
  if (!all_zero) {
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
      result += BASE58_ALPHABET[*it];
    }
  }

  return result;
}

std::string encode_base58(const PublicKey &key) {
  return encode_base58(key.data(), key.size());
}

Result<std::vector<uint8_t>> decode_base58(const std::string &encoded) {
  std::vector<uint8_t> bytes;  // little-endian accumulator

  for (char c : encoded) {
    int digit = base58_digit(c);
    if (digit < 0) {
      return Result<std::vector<uint8_t>>(
          Error::invalid_input(std::string("invalid base58 character '") + c + "'"));
    }

    uint32_t carry = static_cast<uint32_t>(digit);
    for (auto &byte : bytes) {
      carry += static_cast<uint32_t>(byte) * 58;
      byte = carry & 0xFF;
      carry >>= 8;
    }
    while (carry > 0) {
      bytes.push_back(carry & 0xFF);
      carry >>= 8;
    }
  }

  size_t leading_zeros = 0;
  while (leading_zeros < encoded.size() && encoded[leading_zeros] == BASE58_ALPHABET[0]) {
    ++leading_zeros;
  }

  std::vector<uint8_t> result(leading_zeros, 0);
  result.insert(result.end(), bytes.rbegin(), bytes.rend());
  return Result<std::vector<uint8_t>>(std::move(result));
}

Result<PublicKey> pubkey_from_base58(const std::string &encoded) {
  auto decoded = decode_base58(encoded);
  if (decoded.is_err()) {
    return Result<PublicKey>(decoded.error());
  }
  const auto &bytes = decoded.value();
  if (bytes.size() != PUBKEY_BYTES) {
    return Result<PublicKey>(Error::invalid_input(
        "base58 key decodes to " + std::to_string(bytes.size()) + " bytes, expected 32"));
  }
  PublicKey key{};
  std::copy(bytes.begin(), bytes.end(), key.begin());
  return Result<PublicKey>(key);
}

} // namespace common
} // namespace keel
