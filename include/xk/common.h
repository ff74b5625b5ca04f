#pragma once
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <type_traits>

#if defined(_MSC_VER)
#include <intrin.h>
#endif

namespace xk {
namespace detail {
// Portable byte swapping helpers.
template <class T>
[[nodiscard]] constexpr T ManualByteSwap(T value) noexcept {
  static_assert(std::is_trivially_copyable_v<T>, "ManualByteSwap requires trivially copyable types");
  auto source = std::bit_cast<std::array<std::uint8_t, sizeof(T)>>(value);
  std::array<std::uint8_t, sizeof(T)> reversed{};
  for (std::size_t i = 0; i < source.size(); ++i) {
    reversed[i] = source[source.size() - 1U - i];
  }
  return std::bit_cast<T>(reversed);
}

[[nodiscard]] constexpr std::uint64_t ByteSwap64(std::uint64_t value) noexcept {
  if (std::is_constant_evaluated()) {
    return ManualByteSwap(value);
  }
#if defined(_MSC_VER)
  return _byteswap_uint64(value);
#elif defined(__clang__) || defined(__GNUC__)
  return __builtin_bswap64(value);
#else
  return ManualByteSwap(value);
#endif
}
}  // namespace detail

inline constexpr bool kIsLittleEndian = std::endian::native == std::endian::little;

inline constexpr std::uint64_t ToBigEndian(std::uint64_t value) noexcept {
  return kIsLittleEndian ? detail::ByteSwap64(value) : value;
}

inline constexpr std::uint64_t FromBigEndian64(std::uint64_t value) noexcept {
  return ToBigEndian(value);
}

// Reads eight bytes as a big-endian word.
inline std::uint64_t LoadBigEndian64(std::span<const std::uint8_t, 8> bytes) noexcept {
  std::uint64_t raw = 0;
  std::memcpy(&raw, bytes.data(), sizeof(raw));
  return FromBigEndian64(raw);
}

} // namespace xk
