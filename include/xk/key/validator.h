#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "xk/codec/hex.h"
#include "xk/error.h"

// Structural checks for the 128-bit CPU key.
//
// Bit numbering: key bit n is bit (n & 7), least significant first, of byte
// (n >> 3). Bits [0, 106) carry data, bits [106, 128) carry the ECD field.
namespace xk::key {

inline constexpr std::size_t kKeyBits = codec::kKeyBytes * 8;
inline constexpr std::size_t kDataBits = 106;
inline constexpr std::size_t kEcdBits = kKeyBits - kDataBits;
inline constexpr unsigned kRequiredHammingWeight = kDataBits / 2;

// Data-bit mask over the second big-endian word: bytes 8..12 whole, plus the
// two low bits of byte 13.
inline constexpr std::uint64_t kHighWordDataMask = 0xFFFFFFFFFF030000ULL;

// Feedback constant of the reference ECD generator.
inline constexpr std::uint32_t kEcdPolynomial = 0x360325;

[[nodiscard]] unsigned HammingWeight(std::span<const std::uint8_t, codec::kKeyBytes> key) noexcept;

[[nodiscard]] bool HammingWeightOk(std::span<const std::uint8_t, codec::kKeyBytes> key) noexcept;

// Overwrites bits [106, 128) with the check bits derived from bits [0, 106).
void ComputeEcd(std::span<std::uint8_t, codec::kKeyBytes> key) noexcept;

// Recomputes the check bits on a copy and compares them with the stored ones.
[[nodiscard]] bool EcdOk(std::span<const std::uint8_t, codec::kKeyBytes> key) noexcept;

// Runs the semantic checks in order (non-zero, Hamming weight, ECD) and
// returns the first failure.
[[nodiscard]] std::optional<KeyErrorKind> Validate(
    std::span<const std::uint8_t, codec::kKeyBytes> key) noexcept;

}  // namespace xk::key
