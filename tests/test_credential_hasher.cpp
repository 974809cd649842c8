#include "kt/auth/credential_hasher.h"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "kt/common.h"

int main() {
  using kt::auth::CredentialFormat;
  using kt::auth::CredentialHasher;

  CredentialHasher hasher;

  // Round trip through the salted format.
  auto credential = hasher.Hash("1234");
  assert(credential.IsSecure());
  assert(credential.salt_hex.size() == CredentialHasher::kSaltBytes * 2);
  assert(credential.hash_hex.size() == CredentialHasher::kHashBytes * 2);
  const auto serialized = credential.Serialize();
  assert(serialized == credential.salt_hex + "$" + credential.hash_hex);
  assert(hasher.Verify("1234", serialized));
  assert(!hasher.Verify("1235", serialized));
  assert(!hasher.Verify("", serialized));

  // Same PIN, fresh salt, different record.
  auto second = hasher.Hash("1234");
  assert(second.salt_hex != credential.salt_hex);
  assert(second.hash_hex != credential.hash_hex);
  assert(hasher.Verify("1234", second.Serialize()));

  // Known answer: PBKDF2-HMAC-SHA256 over the salt's hex text.
  const std::string fixed =
      "00112233445566778899aabbccddeeff$d722ea95af8abb45631ab78d40ddc19fab580bc4732cd0a9572ebba118e451c4";
  assert(hasher.Verify("1234", fixed));
  assert(!hasher.Verify("4321", fixed));

  // Static-salt records from older releases: 64 hex digits, no separator.
  const std::string static_salt = "a3f6335df71492c01c4ea9d12ea9d0fcc00003430e9119b188290e4f6ce950e5";
  assert(CredentialHasher::DetectFormat(static_salt) == CredentialFormat::kLegacyStaticSalt);
  assert(hasher.Verify("1234", static_salt));
  assert(!hasher.Verify("0000", static_salt));

  // Legacy digest.
  assert(CredentialHasher::LegacyHash("1234") == "wcoy");
  assert(CredentialHasher::LegacyHash("0000") == "vo5c");
  assert(CredentialHasher::LegacyHash("") == "0");
  assert(CredentialHasher::DetectFormat("wcoy") == CredentialFormat::kLegacyDigest);
  assert(hasher.Verify("1234", "wcoy"));
  assert(!hasher.Verify("1243", "wcoy"));

  // Malformed values are rejected, never thrown.
  assert(!hasher.Verify("1234", ""));
  assert(!hasher.Verify("1234", "$"));
  assert(!hasher.Verify("1234", "abcd$"));
  assert(!hasher.Verify("1234", "$abcd"));
  assert(!hasher.Verify("1234", "aa$bb$cc"));
  assert(!CredentialHasher::DetectFormat("aa$bb$cc").has_value());
  assert(!CredentialHasher::Parse("$").has_value());

  auto parsed = CredentialHasher::Parse(fixed);
  assert(parsed.has_value());
  assert(parsed->salt_hex == "00112233445566778899aabbccddeeff");
  assert(parsed->algorithm_version == CredentialFormat::kPbkdf2Sha256);
  assert(parsed->Serialize() == fixed);

  auto legacy = CredentialHasher::Parse(static_salt);
  assert(legacy.has_value());
  assert(!legacy->IsSecure());
  assert(legacy->Serialize() == static_salt);

  // Async entry points agree with the synchronous ones.
  auto hashed = hasher.HashAsync("9876").get();
  assert(hasher.VerifyAsync("9876", hashed.Serialize()).get());
  assert(!hasher.VerifyAsync("6789", hashed.Serialize()).get());

  auto token = CredentialHasher::GenerateSecureToken();
  assert(token.size() == 64);
  assert(kt::IsHexString(token));
  assert(CredentialHasher::GenerateSecureToken(8).size() == 16);
  assert(CredentialHasher::GenerateSecureToken() != token);

  {
    // A wrong first digit and a wrong last digit cost the same to reject.
    const auto stored_1234 = hasher.Hash("1234").Serialize();
    using Clock = std::chrono::steady_clock;
    Clock::duration early_miss{};
    Clock::duration late_miss{};
    for (int trial = 0; trial < 5; ++trial) {
      auto start = Clock::now();
      const bool early = hasher.Verify("0000", stored_1234);
      early_miss += Clock::now() - start;
      start = Clock::now();
      const bool late = hasher.Verify("1239", stored_1234);
      late_miss += Clock::now() - start;
      assert(!early && !late);
    }
    assert(early_miss < late_miss * 10);
    assert(late_miss < early_miss * 10);
  }

  std::cout << "credential hasher tests ok\n";
  return 0;
}
