#pragma once
#include <array>
#include <cstdint>
#include <span>

#include "xk/crypto/provider.h"

namespace xk::crypto {
std::array<uint8_t, kSha1DigestSize> SHA1_Hash(std::span<const uint8_t> data);
std::array<uint8_t, kSha256DigestSize> SHA256_Hash(std::span<const uint8_t> data);
} // namespace xk::crypto
