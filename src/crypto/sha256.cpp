#include "kt/crypto/sha256.h"

#include "kt/common.h"
#include "kt/crypto/provider.h"

namespace kt::crypto {

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  auto provider = GetCryptoProviderShared();
  return provider->SHA256(data);
}

std::array<uint8_t, 32> SHA256_Hash(std::string_view text) {
  return SHA256_Hash(kt::AsBytes(text));
}

}  // namespace kt::crypto
