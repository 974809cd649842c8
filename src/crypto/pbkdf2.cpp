#include "kt/crypto/pbkdf2.h"

#include <algorithm>

#include "kt/crypto/provider.h"

namespace kt::crypto {

std::array<uint8_t, 32> PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                                           std::span<const uint8_t> salt,
                                           uint32_t iterations) {
  iterations = std::max<uint32_t>(iterations, 1u);
  auto provider = GetCryptoProviderShared();
  return provider->PBKDF2HMACSHA256(password, salt, iterations);
}

}  // namespace kt::crypto
