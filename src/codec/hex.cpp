#include "xk/codec/hex.h"

#include <algorithm>

#include "xk/errors.h"

namespace xk::codec {

std::optional<KeyErrorKind> DecodeHex(std::string_view text,
                                      std::span<std::uint8_t, kKeyBytes> out) noexcept {
  if (text.size() != kKeyHexChars) {
    return KeyErrorKind::kShape;
  }
  for (std::size_t i = 0; i < kKeyBytes; ++i) {
    const std::uint8_t hi = detail::kDecodeTable[static_cast<unsigned char>(text[2 * i])];
    const std::uint8_t lo = detail::kDecodeTable[static_cast<unsigned char>(text[2 * i + 1])];
    if ((hi | lo) & 0xF0) {
      return KeyErrorKind::kMalformed;
    }
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return std::nullopt;
}

std::optional<KeyErrorKind> CheckByteShape(std::span<const std::uint8_t> bytes) noexcept {
  if (bytes.size() != kKeyBytes) {
    return KeyErrorKind::kShape;
  }
  return std::nullopt;
}

std::string_view DescribeTextFailure(std::string_view text, KeyErrorKind kind) noexcept {
  switch (kind) {
  case KeyErrorKind::kShape:
    return (text.size() % 2 != 0) ? errors::msg::kKeyTextOddLength : errors::msg::kKeyTextLength;
  case KeyErrorKind::kMalformed:
    return errors::msg::kKeyTextNonHex;
  case KeyErrorKind::kNullInput:
    return errors::msg::kNullKeyText;
  case KeyErrorKind::kEmpty:
    return errors::msg::kKeyEmpty;
  case KeyErrorKind::kHammingWeight:
    return errors::msg::kKeyHammingWeight;
  case KeyErrorKind::kEcd:
    return errors::msg::kKeyEcd;
  }
  return errors::msg::kKeyTextNonHex;
}

void EncodeHexTo(std::span<const std::uint8_t, kKeyBytes> bytes,
                 std::span<char, kKeyHexChars> out) noexcept {
  for (std::size_t i = 0; i < kKeyBytes; ++i) {
    out[2 * i] = detail::kEncodeTable[2 * bytes[i]];
    out[2 * i + 1] = detail::kEncodeTable[2 * bytes[i] + 1];
  }
}

std::string EncodeHex(std::span<const std::uint8_t, kKeyBytes> bytes) {
  if (IsAllZero(bytes)) {
    return std::string{};
  }
  std::string text(kKeyHexChars, '\0');
  EncodeHexTo(bytes, std::span<char, kKeyHexChars>(text.data(), kKeyHexChars));
  return text;
}

std::string EncodeDigestHex(std::span<const std::uint8_t> bytes) {
  std::string text(2 * bytes.size(), '\0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    text[2 * i] = detail::kEncodeTableLower[2 * bytes[i]];
    text[2 * i + 1] = detail::kEncodeTableLower[2 * bytes[i] + 1];
  }
  return text;
}

bool EqualsHex(std::span<const std::uint8_t, kKeyBytes> bytes, std::string_view text) noexcept {
  if (text.size() != kKeyHexChars) {
    return false;
  }
  for (std::size_t i = 0; i < kKeyBytes; ++i) {
    const std::uint8_t hi = detail::kDecodeTable[static_cast<unsigned char>(text[2 * i])];
    const std::uint8_t lo = detail::kDecodeTable[static_cast<unsigned char>(text[2 * i + 1])];
    if ((hi | lo) & 0xF0) {
      return false;
    }
    if (bytes[i] != static_cast<std::uint8_t>((hi << 4) | lo)) {
      return false;
    }
  }
  return true;
}

bool IsAllZero(std::span<const std::uint8_t, kKeyBytes> bytes) noexcept {
  return std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b == 0; });
}

}  // namespace xk::codec
