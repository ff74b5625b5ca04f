#pragma once
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include "xk/codec/hex.h"
#include "xk/crypto/provider.h"
#include "xk/error.h"

namespace xk::key {

// Immutable 128-bit console CPU key.
//
// Every throwing constructor and Parse overload yields a key that passed the
// shape, non-zero, Hamming-weight and ECD checks, in that order; the first
// failing check is reported as a KeyError. The default-constructed value is
// the all-zero Empty sentinel, which is never valid.
class CpuKey {
public:
  static constexpr std::size_t kSize = codec::kKeyBytes;
  static constexpr std::size_t kTextSize = codec::kKeyHexChars;

  using Bytes = codec::KeyBytes;
  using Digest = std::array<std::uint8_t, crypto::kSha1DigestSize>;
  using RandomSource = std::function<void(std::span<std::uint8_t>)>;

  constexpr CpuKey() noexcept = default;
  explicit CpuKey(std::span<const std::uint8_t> bytes);
  explicit CpuKey(std::string_view text);
  explicit CpuKey(const char* text);

  static const CpuKey& Empty() noexcept;

  static CpuKey Parse(std::span<const std::uint8_t> bytes);
  static CpuKey Parse(std::string_view text);
  static CpuKey Parse(const char* text);

  // Never throws. Malformed input leaves `out` empty; well-formed input that
  // fails a semantic check sets `out` to Empty().
  static bool TryParse(std::span<const std::uint8_t> bytes, std::optional<CpuKey>& out) noexcept;
  static bool TryParse(std::string_view text, std::optional<CpuKey>& out) noexcept;
  static bool TryParse(const char* text, std::optional<CpuKey>& out) noexcept;

  // First failing check, or nullopt for a valid key.
  [[nodiscard]] static std::optional<KeyErrorKind> Check(std::span<const std::uint8_t> bytes) noexcept;
  [[nodiscard]] static std::optional<KeyErrorKind> Check(std::string_view text) noexcept;

  // Rejection-samples random data bits until the non-zero and Hamming-weight
  // checks hold, then seals the ECD field. Expected ~13 draws; bounded by
  // config::RuntimeConfig::random_max_attempts.
  static CpuKey CreateRandom();
  static CpuKey CreateRandom(const RandomSource& source);

  [[nodiscard]] bool IsValid() const noexcept;
  [[nodiscard]] bool IsEmpty() const noexcept;

  std::span<const std::uint8_t, kSize> AsSpan() const noexcept { return bytes_; }
  Bytes ToArray() const noexcept { return bytes_; }

  // Uppercase hex; empty string for Empty().
  std::string ToString() const;

  // SHA-1 of the 16 raw bytes.
  Digest GetDigest() const;

  std::size_t Hash() const noexcept;

  bool Equals(const CpuKey& other) const noexcept;
  bool Equals(std::span<const std::uint8_t> bytes) const noexcept;
  bool Equals(std::string_view text) const noexcept;

  // Unsigned byte-wise order, most significant byte first. A null `other`
  // orders below every key.
  int Compare(const CpuKey& other) const noexcept;
  int Compare(const CpuKey* other) const noexcept;

  friend bool operator==(const CpuKey& a, const CpuKey& b) noexcept { return a.Equals(b); }
  friend bool operator==(const CpuKey& a, std::span<const std::uint8_t> b) noexcept {
    return a.Equals(b);
  }
  friend bool operator==(const CpuKey& a, std::string_view b) noexcept { return a.Equals(b); }
  friend std::strong_ordering operator<=>(const CpuKey& a, const CpuKey& b) noexcept;

private:
  struct Unchecked {};
  constexpr CpuKey(const Bytes& bytes, Unchecked) noexcept : bytes_(bytes) {}

  Bytes bytes_{};
};

std::ostream& operator<<(std::ostream& os, const CpuKey& key);

}  // namespace xk::key

template <>
struct std::hash<xk::key::CpuKey> {
  std::size_t operator()(const xk::key::CpuKey& key) const noexcept { return key.Hash(); }
};
