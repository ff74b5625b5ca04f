#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>

namespace xk::crypto {

inline constexpr std::size_t kSha1DigestSize = 20;
inline constexpr std::size_t kSha256DigestSize = 32;

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual std::array<uint8_t, kSha1DigestSize> SHA1(std::span<const uint8_t> data) = 0;

  virtual std::array<uint8_t, kSha256DigestSize> SHA256(std::span<const uint8_t> data) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  std::array<uint8_t, kSha1DigestSize> SHA1(std::span<const uint8_t> data) override;

  std::array<uint8_t, kSha256DigestSize> SHA256(std::span<const uint8_t> data) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
CryptoProvider& GetCryptoProvider();
void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider);
void EnsureCryptoProviderInitialized(); // runs the known-answer tests once
void ResetCryptoProviderForTesting();

}  // namespace xk::crypto
