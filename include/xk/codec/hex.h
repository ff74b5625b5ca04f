#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "xk/error.h"

namespace xk::codec {

inline constexpr std::size_t kKeyBytes = 16;
inline constexpr std::size_t kKeyHexChars = kKeyBytes * 2;

using KeyBytes = std::array<std::uint8_t, kKeyBytes>;

namespace detail {
inline constexpr std::array<char, 2 * 256> MakeEncodeTable(const char (&digits)[17]) {
  std::array<char, 2 * 256> table{};
  for (std::size_t i = 0; i < 256; ++i) {
    table[2 * i] = digits[i >> 4];
    table[2 * i + 1] = digits[i & 0x0F];
  }
  return table;
}

// 0xFF marks characters outside [0-9a-fA-F].
inline constexpr std::array<std::uint8_t, 256> MakeDecodeTable() {
  std::array<std::uint8_t, 256> table{};
  for (auto& v : table) {
    v = 0xFF;
  }
  for (int i = 0; i < 10; ++i) {
    table[static_cast<unsigned char>('0' + i)] = static_cast<std::uint8_t>(i);
  }
  for (int i = 0; i < 6; ++i) {
    table[static_cast<unsigned char>('a' + i)] = static_cast<std::uint8_t>(10 + i);
    table[static_cast<unsigned char>('A' + i)] = static_cast<std::uint8_t>(10 + i);
  }
  return table;
}

inline constexpr auto kEncodeTable = MakeEncodeTable("0123456789ABCDEF");
inline constexpr auto kEncodeTableLower = MakeEncodeTable("0123456789abcdef");
inline constexpr auto kDecodeTable = MakeDecodeTable();
}  // namespace detail

// Decodes exactly 32 hex characters (any case) into `out`. Returns the
// failure kind (kShape or kMalformed) and leaves `out` unspecified on error.
[[nodiscard]] std::optional<KeyErrorKind> DecodeHex(std::string_view text,
                                                    std::span<std::uint8_t, kKeyBytes> out) noexcept;

// Shape-only check for binary input.
[[nodiscard]] std::optional<KeyErrorKind> CheckByteShape(std::span<const std::uint8_t> bytes) noexcept;

// Human-readable reason for a DecodeHex failure on `text`.
std::string_view DescribeTextFailure(std::string_view text, KeyErrorKind kind) noexcept;

// Writes 32 uppercase hex characters, no allocation.
void EncodeHexTo(std::span<const std::uint8_t, kKeyBytes> bytes,
                 std::span<char, kKeyHexChars> out) noexcept;

// Uppercase hex. The all-zero value encodes to the empty string.
std::string EncodeHex(std::span<const std::uint8_t, kKeyBytes> bytes);

// Lowercase hex of arbitrary bytes; digests print this way.
std::string EncodeDigestHex(std::span<const std::uint8_t> bytes);

// Case-insensitive comparison of `bytes` against hex text without decoding
// into a temporary key. Text of the wrong shape never matches.
[[nodiscard]] bool EqualsHex(std::span<const std::uint8_t, kKeyBytes> bytes,
                             std::string_view text) noexcept;

[[nodiscard]] bool IsAllZero(std::span<const std::uint8_t, kKeyBytes> bytes) noexcept;

}  // namespace xk::codec
