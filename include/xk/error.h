#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xk {
  enum class ErrorDomain : std::uint16_t {
    Validation = 0x01,
    Crypto = 0x02,
    IO = 0x04,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes so propagated platform error numbers
  // never collide with framework codes. Codes inside a span are stable.
  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Validation:
      return 0x0100;
    case ErrorDomain::Crypto:
      return 0x0200;
    case ErrorDomain::IO:
      return 0x0400;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  // Which structural check rejected a key. Strict paths throw it inside a
  // KeyError, non-throwing paths return it directly.
  enum class KeyErrorKind : std::uint8_t {
    kNullInput = 1,
    kShape,
    kMalformed,
    kEmpty,
    kHammingWeight,
    kEcd
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace key {
      inline constexpr int kNullInput = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kShape = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kMalformed = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kEmpty = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kHammingWeight = Make(ErrorDomain::Validation, 0x05);
      inline constexpr int kEcd = Make(ErrorDomain::Validation, 0x06);
    } // namespace key

    namespace crypto {
      inline constexpr int kDigestFailed = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kSelfTestFailed = Make(ErrorDomain::Crypto, 0x02);
      inline constexpr int kRandomUnavailable = Make(ErrorDomain::Crypto, 0x03);
    } // namespace crypto

    namespace io {
      inline constexpr int kLogOpenFailed = Make(ErrorDomain::IO, 0x01);
    } // namespace io

    namespace internal {
      inline constexpr int kRandomAttemptsExhausted = Make(ErrorDomain::Internal, 0x01);
    } // namespace internal

    inline constexpr int CodeFor(KeyErrorKind kind) {
      switch (kind) {
      case KeyErrorKind::kNullInput:
        return key::kNullInput;
      case KeyErrorKind::kShape:
        return key::kShape;
      case KeyErrorKind::kMalformed:
        return key::kMalformed;
      case KeyErrorKind::kEmpty:
        return key::kEmpty;
      case KeyErrorKind::kHammingWeight:
        return key::kHammingWeight;
      case KeyErrorKind::kEcd:
        return key::kEcd;
      }
      return ErrorDomainBase(ErrorDomain::Validation);
    }
  } // namespace errors

  // Stable lowercase name, used by the CLI and in diagnostics events.
  inline constexpr std::string_view KeyErrorKindName(KeyErrorKind kind) {
    switch (kind) {
    case KeyErrorKind::kNullInput:
      return "null_input";
    case KeyErrorKind::kShape:
      return "shape";
    case KeyErrorKind::kMalformed:
      return "malformed";
    case KeyErrorKind::kEmpty:
      return "empty";
    case KeyErrorKind::kHammingWeight:
      return "hamming_weight";
    case KeyErrorKind::kEcd:
      return "ecd";
    }
    return "unknown";
  }

  // True for the kinds where no key value can be produced at all.
  inline constexpr bool IsMalformedKind(KeyErrorKind kind) {
    return kind == KeyErrorKind::kNullInput || kind == KeyErrorKind::kShape ||
           kind == KeyErrorKind::kMalformed;
  }

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          context(std::move(ctx)) {}
  };

  struct KeyError : public Error {
    KeyErrorKind kind;
    KeyError(KeyErrorKind k, std::string msg)
        : Error(ErrorDomain::Validation, errors::CodeFor(k), std::move(msg)), kind(k) {}
  };
} // namespace xk
