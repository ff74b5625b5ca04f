#pragma once

#include <string_view>

namespace xk::errors::msg {
// Centralized message catalog
inline constexpr std::string_view kNullKeyText{"CPU key text is null"};
inline constexpr std::string_view kKeyByteLength{"CPU key must be exactly 16 bytes"};
inline constexpr std::string_view kKeyTextLength{"CPU key text must be exactly 32 hex characters"};
inline constexpr std::string_view kKeyTextOddLength{"CPU key text has an odd number of characters"};
inline constexpr std::string_view kKeyTextNonHex{"CPU key text contains a non-hex character"};
inline constexpr std::string_view kKeyEmpty{"CPU key is empty (all zero)"};
inline constexpr std::string_view kKeyHammingWeight{"CPU key Hamming weight is not 53"};
inline constexpr std::string_view kKeyEcd{"CPU key ECD does not match its data bits"};
inline constexpr std::string_view kRandomAttemptsExhausted{"Random CPU key generation exceeded attempt limit"};
inline constexpr std::string_view kDigestFailed{"SHA-1 digest failed"};
inline constexpr std::string_view kSelfTestFailed{"Crypto provider self-test failed"};
}  // namespace xk::errors::msg
