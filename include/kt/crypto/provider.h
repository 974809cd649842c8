#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace kt::crypto {

inline constexpr std::size_t kHmacTagSize = 32;
using HmacTag = std::array<uint8_t, kHmacTagSize>;

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) = 0;

  virtual std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) = 0;

  // PBKDF2 with HMAC-SHA256 as the PRF, producing one 32-byte block.
  virtual std::array<uint8_t, 32> PBKDF2HMACSHA256(
      std::span<const uint8_t> password,
      std::span<const uint8_t> salt,
      uint32_t iterations) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) override;

  std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) override;

  std::array<uint8_t, 32> PBKDF2HMACSHA256(
      std::span<const uint8_t> password,
      std::span<const uint8_t> salt,
      uint32_t iterations) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
CryptoProvider& GetCryptoProvider();
void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider);
void EnsureCryptoProviderInitialized(); // runs the known-answer self-test once
void ResetCryptoProviderForTesting();

// Keyed through the active provider; seals state files and chains the audit log.
HmacTag ComputeHmacSha256(std::span<const uint8_t> key, std::span<const uint8_t> message);

}  // namespace kt::crypto
