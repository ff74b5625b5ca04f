#include "xk/key/validator.h"

#include <algorithm>
#include <bit>

#include "xk/common.h"

namespace xk::key {

unsigned HammingWeight(std::span<const std::uint8_t, codec::kKeyBytes> key) noexcept {
  const std::uint64_t low = LoadBigEndian64(key.first<8>());
  const std::uint64_t high = LoadBigEndian64(key.last<8>()) & kHighWordDataMask;
  return static_cast<unsigned>(std::popcount(low) + std::popcount(high));
}

bool HammingWeightOk(std::span<const std::uint8_t, codec::kKeyBytes> key) noexcept {
  return HammingWeight(key) == kRequiredHammingWeight;
}

void ComputeEcd(std::span<std::uint8_t, codec::kKeyBytes> key) noexcept {
  std::uint32_t acc1 = 0;
  std::uint32_t acc2 = 0;
  for (std::size_t bit = 0; bit < kKeyBits; ++bit, acc1 >>= 1) {
    const std::size_t index = bit >> 3;
    const auto mask = static_cast<std::uint8_t>(1u << (bit & 7));
    const std::uint32_t value = (key[index] & mask) ? 1u : 0u;
    if (bit < kDataBits) {
      acc1 ^= value;
      if (acc1 & 1u) {
        acc1 ^= kEcdPolynomial;
      }
      acc2 ^= value;
    } else if (bit < kKeyBits - 1) {
      if (value != (acc1 & 1u)) {
        key[index] ^= mask;
      }
      acc2 ^= acc1 & 1u;
    } else if (value != acc2) {
      // Final bit is overall parity.
      key[index] ^= mask;
    }
  }
}

bool EcdOk(std::span<const std::uint8_t, codec::kKeyBytes> key) noexcept {
  codec::KeyBytes sealed{};
  std::copy(key.begin(), key.end(), sealed.begin());
  ComputeEcd(sealed);
  return std::equal(sealed.begin(), sealed.end(), key.begin());
}

std::optional<KeyErrorKind> Validate(std::span<const std::uint8_t, codec::kKeyBytes> key) noexcept {
  if (codec::IsAllZero(key)) {
    return KeyErrorKind::kEmpty;
  }
  if (!HammingWeightOk(key)) {
    return KeyErrorKind::kHammingWeight;
  }
  if (!EcdOk(key)) {
    return KeyErrorKind::kEcd;
  }
  return std::nullopt;
}

}  // namespace xk::key
