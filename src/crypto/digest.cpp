#include "xk/crypto/digest.h"

namespace xk::crypto {

std::array<uint8_t, kSha1DigestSize> SHA1_Hash(std::span<const uint8_t> data) {
  auto provider = GetCryptoProviderShared();
  return provider->SHA1(data);
}

std::array<uint8_t, kSha256DigestSize> SHA256_Hash(std::span<const uint8_t> data) {
  auto provider = GetCryptoProviderShared();
  return provider->SHA256(data);
}

}  // namespace xk::crypto
