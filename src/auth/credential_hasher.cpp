#include "kt/auth/credential_hasher.h"

#include <array>
#include <cstdint>
#include <future>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "kt/common.h"
#include "kt/crypto/ct.h"
#include "kt/crypto/pbkdf2.h"
#include "kt/crypto/random.h"
#include "kt/security/zeroizer.h"

namespace kt::auth {

namespace {

constexpr size_t kHashHexLength = CredentialHasher::kHashBytes * 2;

std::string ToBase36(int32_t value) {
  static constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  if (value == 0) {
    return "0";
  }
  const bool negative = value < 0;
  // Widen before negating so INT32_MIN stays representable.
  int64_t magnitude = negative ? -static_cast<int64_t>(value) : static_cast<int64_t>(value);
  std::string digits;
  while (magnitude > 0) {
    digits.insert(digits.begin(), kDigits[magnitude % 36]);
    magnitude /= 36;
  }
  if (negative) {
    digits.insert(digits.begin(), '-');
  }
  return digits;
}

}  // namespace

std::string Credential::Serialize() const {
  switch (algorithm_version) {
    case CredentialFormat::kPbkdf2Sha256:
      return salt_hex + CredentialHasher::kSeparator + hash_hex;
    case CredentialFormat::kLegacyStaticSalt:
    case CredentialFormat::kLegacyDigest:
      return hash_hex;
  }
  return hash_hex;
}

std::string CredentialHasher::DeriveHex(std::string_view pin, std::string_view salt) {
  // The salt enters the KDF as the bytes of its hex text, matching records
  // written by earlier releases.
  auto derived = kt::crypto::PBKDF2_HMAC_SHA256(kt::AsBytes(pin), kt::AsBytes(salt), kIterations);
  kt::security::Zeroizer::ScopeWiper<uint8_t> guard(std::span<uint8_t>(derived.data(), derived.size()));
  return kt::HexEncode(std::span<const uint8_t>(derived.data(), derived.size()));
}

Credential CredentialHasher::Hash(std::string_view pin) const {
  std::array<uint8_t, kSaltBytes> salt{};
  kt::crypto::SystemRandomBytes(std::span<uint8_t>(salt.data(), salt.size()));

  Credential credential;
  credential.salt_hex = kt::HexEncode(std::span<const uint8_t>(salt.data(), salt.size()));
  credential.hash_hex = DeriveHex(pin, credential.salt_hex);
  credential.algorithm_version = CredentialFormat::kPbkdf2Sha256;
  return credential;
}

bool CredentialHasher::Verify(std::string_view pin, std::string_view stored) const {
  const auto format = DetectFormat(stored);
  if (!format) {
    return false;
  }

  switch (*format) {
    case CredentialFormat::kPbkdf2Sha256: {
      const auto split = stored.find(kSeparator);
      const auto salt = stored.substr(0, split);
      const auto expected = stored.substr(split + 1);
      auto computed = DeriveHex(pin, salt);
      const bool match = kt::crypto::ct::StringCompare(computed, expected);
      kt::security::Zeroizer::WipeString(computed);
      return match;
    }
    case CredentialFormat::kLegacyStaticSalt: {
      auto computed = DeriveHex(pin, kLegacyStaticSalt);
      const bool match = kt::crypto::ct::StringCompare(computed, stored);
      kt::security::Zeroizer::WipeString(computed);
      return match;
    }
    case CredentialFormat::kLegacyDigest: {
      auto computed = LegacyHash(pin);
      const bool match = kt::crypto::ct::StringCompare(computed, stored);
      kt::security::Zeroizer::WipeString(computed);
      return match;
    }
  }
  return false;
}

std::future<Credential> CredentialHasher::HashAsync(std::string pin) const {
  return std::async(std::launch::async, [this, pin = std::move(pin)]() mutable {
    auto credential = Hash(pin);
    kt::security::Zeroizer::WipeString(pin);
    return credential;
  });
}

std::future<bool> CredentialHasher::VerifyAsync(std::string pin, std::string stored) const {
  return std::async(std::launch::async,
                    [this, pin = std::move(pin), stored = std::move(stored)]() mutable {
                      const bool match = Verify(pin, stored);
                      kt::security::Zeroizer::WipeString(pin);
                      return match;
                    });
}

std::string CredentialHasher::LegacyHash(std::string_view pin) {
  uint32_t hash = 0;
  for (unsigned char ch : pin) {
    hash = (hash << 5) - hash + static_cast<uint32_t>(ch);
  }
  return ToBase36(static_cast<int32_t>(hash));
}

std::optional<CredentialFormat> CredentialHasher::DetectFormat(std::string_view stored) {
  if (stored.empty()) {
    return std::nullopt;
  }
  const auto split = stored.find(kSeparator);
  if (split == std::string_view::npos) {
    if (stored.size() == kHashHexLength && kt::IsHexString(stored)) {
      return CredentialFormat::kLegacyStaticSalt;
    }
    return CredentialFormat::kLegacyDigest;
  }
  const auto salt = stored.substr(0, split);
  const auto hash = stored.substr(split + 1);
  if (salt.empty() || hash.empty() || hash.find(kSeparator) != std::string_view::npos) {
    return std::nullopt;
  }
  return CredentialFormat::kPbkdf2Sha256;
}

std::optional<Credential> CredentialHasher::Parse(std::string_view stored) {
  const auto format = DetectFormat(stored);
  if (!format) {
    return std::nullopt;
  }
  Credential credential;
  credential.algorithm_version = *format;
  if (*format == CredentialFormat::kPbkdf2Sha256) {
    const auto split = stored.find(kSeparator);
    credential.salt_hex = std::string(stored.substr(0, split));
    credential.hash_hex = std::string(stored.substr(split + 1));
  } else if (*format == CredentialFormat::kLegacyStaticSalt) {
    credential.salt_hex = std::string(kLegacyStaticSalt);
    credential.hash_hex = std::string(stored);
  } else {
    credential.hash_hex = std::string(stored);
  }
  return credential;
}

std::string CredentialHasher::GenerateSecureToken(size_t bytes) {
  std::vector<uint8_t> buffer(bytes);
  kt::crypto::SystemRandomBytes(std::span<uint8_t>(buffer.data(), buffer.size()));
  auto token = kt::HexEncode(std::span<const uint8_t>(buffer.data(), buffer.size()));
  kt::security::Zeroizer::WipeVector(buffer);
  return token;
}

}  // namespace kt::auth
