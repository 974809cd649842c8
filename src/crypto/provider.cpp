#include "kt/crypto/provider.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <array>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "kt/crypto/ct.h"
#include "kt/error.h"

namespace kt::crypto {

namespace {

void ThrowCryptoError(const std::string& message, int code = 0);

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

void ThrowCryptoError(const std::string& message, int code) {
  throw kt::Error(kt::ErrorDomain::Crypto, code, message);
}

std::span<const uint8_t> Bytes(std::string_view text) {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

// RFC 4231 test case 2 and RFC 7914 section 11 PBKDF2-HMAC-SHA256 vector.
void RunKnownAnswerTests() {
  static constexpr std::array<uint8_t, 32> kExpectedHmac{
      0x5b, 0xdc, 0xc1, 0x46, 0xbf, 0x60, 0x75, 0x4e, 0x6a, 0x04, 0x24,
      0x26, 0x08, 0x95, 0x75, 0xc7, 0x5a, 0x00, 0x3f, 0x08, 0x9d, 0x27,
      0x39, 0x83, 0x9d, 0xec, 0x58, 0xb9, 0x64, 0xec, 0x38, 0x43};
  static constexpr std::array<uint8_t, 32> kExpectedPbkdf2{
      0x55, 0xac, 0x04, 0x6e, 0x56, 0xe3, 0x08, 0x9f, 0xec, 0x16, 0x91,
      0xc2, 0x25, 0x44, 0xb6, 0x05, 0xf9, 0x41, 0x85, 0x21, 0x6d, 0xde,
      0x04, 0x65, 0xe6, 0x8b, 0x9d, 0x57, 0xc2, 0x0d, 0xac, 0xbc};

  OpenSSLCryptoProvider provider;
  const auto mac = provider.HMACSHA256(Bytes("Jefe"), Bytes("what do ya want for nothing?"));
  if (!ct::CompareEqual(mac, kExpectedHmac)) {
    ThrowCryptoError("HMAC-SHA256 KAT mismatch");
  }
  const auto derived = provider.PBKDF2HMACSHA256(Bytes("passwd"), Bytes("salt"), 1);
  if (!ct::CompareEqual(derived, kExpectedPbkdf2)) {
    ThrowCryptoError("PBKDF2-HMAC-SHA256 KAT mismatch");
  }
}

void EnsureCryptoRuntimeConfigured() {
  auto& state = MutableRuntimeState();
  std::call_once(state.once, [&state]() {
    RunKnownAnswerTests();
    state.kat_passed = true;
    std::clog << "[crypto] HMAC/PBKDF2 known-answer tests passed" << std::endl;
  });
}

}  // namespace

void EnsureCryptoProviderInitialized() {
  EnsureCryptoRuntimeConfigured();
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::HMACSHA256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> message) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  static constexpr uint8_t kEmpty = 0;
  const uint8_t* key_ptr = key.empty() ? &kEmpty : key.data();
  const uint8_t* msg_ptr = message.empty() ? &kEmpty : message.data();
  if (HMAC(EVP_sha256(), key_ptr, static_cast<int>(key.size()), msg_ptr,
           message.size(), out.data(), &len) == nullptr) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("HMAC(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected HMAC-SHA256 length", static_cast<int>(len));
  }
  return out;
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::SHA256(
    std::span<const uint8_t> data) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_Digest(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected SHA-256 length", static_cast<int>(len));
  }
  return out;
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::PBKDF2HMACSHA256(
    std::span<const uint8_t> password,
    std::span<const uint8_t> salt,
    uint32_t iterations) {
  std::array<uint8_t, 32> out{};
  iterations = std::max<uint32_t>(iterations, 1u);
  static constexpr uint8_t kEmpty = 0;
  const auto* pass_ptr = reinterpret_cast<const char*>(password.empty() ? &kEmpty : password.data());
  const uint8_t* salt_ptr = salt.empty() ? &kEmpty : salt.data();
  if (PKCS5_PBKDF2_HMAC(pass_ptr, static_cast<int>(password.size()), salt_ptr,
                        static_cast<int>(salt.size()), static_cast<int>(iterations), EVP_sha256(),
                        static_cast<int>(out.size()), out.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("PKCS5_PBKDF2_HMAC(EVP_sha256)"));
  }
  return out;
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

void ResetCryptoProviderForTesting() {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance().reset();
}

HmacTag ComputeHmacSha256(std::span<const uint8_t> key, std::span<const uint8_t> message) {
  return GetCryptoProviderShared()->HMACSHA256(key, message);
}

}  // namespace kt::crypto
