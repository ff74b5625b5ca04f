#include "xk/crypto/provider.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <mutex>
#include <string>
#include <utility>

#include "xk/crypto/ct.h"
#include "xk/error.h"
#include "xk/errors.h"

namespace xk::crypto {

namespace {

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

[[noreturn]] void ThrowCryptoError(const std::string& message, int code) {
  throw xk::Error(xk::ErrorDomain::Crypto, code, message);
}

template <std::size_t N>
std::array<uint8_t, N> EvpDigest(const EVP_MD* md, std::span<const uint8_t> data,
                                 const char* context) {
  std::array<uint8_t, N> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, md, nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage(context), errors::crypto::kDigestFailed);
  }
  if (len != out.size()) {
    ThrowCryptoError(std::string(errors::msg::kDigestFailed) + ": unexpected length " +
                         std::to_string(len),
                     errors::crypto::kDigestFailed);
  }
  return out;
}

struct RuntimeState {
  std::once_flag once;
  bool kat_passed{false};
};

RuntimeState& MutableRuntimeState() {
  static RuntimeState state{};
  return state;
}

std::mutex& ProviderMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<CryptoProvider>& ProviderInstance() {
  static std::shared_ptr<CryptoProvider> instance;
  return instance;
}

void RunDigestKnownAnswerTests() {
  // FIPS 180 "abc" vectors.
  static constexpr std::array<uint8_t, 3> kMessage{'a', 'b', 'c'};
  static constexpr std::array<uint8_t, kSha1DigestSize> kExpectedSha1{
      0xa9, 0x99, 0x3e, 0x36, 0x47, 0x06, 0x81, 0x6a, 0xba, 0x3e,
      0x25, 0x71, 0x78, 0x50, 0xc2, 0x6c, 0x9c, 0xd0, 0xd8, 0x9d};
  static constexpr std::array<uint8_t, kSha256DigestSize> kExpectedSha256{
      0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea, 0x41, 0x41, 0x40,
      0xde, 0x5d, 0xae, 0x22, 0x23, 0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17,
      0x7a, 0x9c, 0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad};

  OpenSSLCryptoProvider provider;
  if (!ct::CompareEqual(provider.SHA1(kMessage), kExpectedSha1)) {
    ThrowCryptoError(std::string(errors::msg::kSelfTestFailed) + ": SHA-1",
                     errors::crypto::kSelfTestFailed);
  }
  if (!ct::CompareEqual(provider.SHA256(kMessage), kExpectedSha256)) {
    ThrowCryptoError(std::string(errors::msg::kSelfTestFailed) + ": SHA-256",
                     errors::crypto::kSelfTestFailed);
  }
}

void EnsureCryptoRuntimeConfigured() {
  auto& state = MutableRuntimeState();
  std::call_once(state.once, [&state]() {
    RunDigestKnownAnswerTests();
    state.kat_passed = true;
  });
}

}  // namespace

std::array<uint8_t, kSha1DigestSize> OpenSSLCryptoProvider::SHA1(std::span<const uint8_t> data) {
  return EvpDigest<kSha1DigestSize>(EVP_sha1(), data, "EVP_Digest(EVP_sha1)");
}

std::array<uint8_t, kSha256DigestSize> OpenSSLCryptoProvider::SHA256(
    std::span<const uint8_t> data) {
  return EvpDigest<kSha256DigestSize>(EVP_sha256(), data, "EVP_Digest(EVP_sha256)");
}

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  EnsureCryptoRuntimeConfigured();
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& provider = ProviderInstance();
  if (!provider) {
    provider = std::make_shared<OpenSSLCryptoProvider>();
  }
  return provider;
}

CryptoProvider& GetCryptoProvider() {
  return *GetCryptoProviderShared();
}

void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider) {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance() = std::move(provider);
}

void EnsureCryptoProviderInitialized() {
  EnsureCryptoRuntimeConfigured();
}

void ResetCryptoProviderForTesting() {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance().reset();
}

}  // namespace xk::crypto
