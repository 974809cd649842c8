#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <string_view>

namespace kt::auth {

// Stored as the record's algorithm version. Values are persisted, never renumber.
enum class CredentialFormat : uint8_t {
  kLegacyDigest = 0,      // 32-bit string hash in base 36, no salt
  kLegacyStaticSalt = 1,  // PBKDF2 over a fixed implicit salt, bare hex
  kPbkdf2Sha256 = 2,      // PBKDF2 over a random salt, "salt$hash"
};

struct Credential {
  std::string salt_hex;
  std::string hash_hex;
  CredentialFormat algorithm_version{CredentialFormat::kPbkdf2Sha256};

  [[nodiscard]] std::string Serialize() const;
  [[nodiscard]] bool IsSecure() const noexcept {
    return algorithm_version == CredentialFormat::kPbkdf2Sha256;
  }
};

class CredentialHasher {
 public:
  static constexpr char kSeparator = '$';
  static constexpr size_t kSaltBytes = 16;
  static constexpr size_t kHashBytes = 32;
  static constexpr uint32_t kIterations = 100'000;
  static constexpr std::string_view kLegacyStaticSalt{"kincircle-pin-salt-v1"};

  // Random salt, PBKDF2-HMAC-SHA256, secure format.
  [[nodiscard]] Credential Hash(std::string_view pin) const;

  // Routes on the separator and compares in constant time. Malformed stored
  // values yield false. Crypto provider failures propagate as kt::Error.
  [[nodiscard]] bool Verify(std::string_view pin, std::string_view stored) const;

  // Derivation runs on a worker thread so the caller's event loop stays free.
  [[nodiscard]] std::future<Credential> HashAsync(std::string pin) const;
  [[nodiscard]] std::future<bool> VerifyAsync(std::string pin, std::string stored) const;

  // Deprecated digest kept for migrating old records.
  [[nodiscard]] static std::string LegacyHash(std::string_view pin);

  [[nodiscard]] static std::optional<CredentialFormat> DetectFormat(std::string_view stored);
  [[nodiscard]] static std::optional<Credential> Parse(std::string_view stored);

  [[nodiscard]] static std::string GenerateSecureToken(size_t bytes = 32);

 private:
  [[nodiscard]] static std::string DeriveHex(std::string_view pin, std::string_view salt);
};

}  // namespace kt::auth
