#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "kt/auth/credential_hasher.h"
#include "kt/auth/pin_policy.h"

namespace kt::auth {

inline constexpr uint32_t kStoredCredentialVersion = 1;

// What the backend persists. `secure` travels beside the serialized value so
// old records written before the flag existed read back as legacy.
struct StoredCredential {
  std::string serialized;
  bool secure{false};
  uint32_t version{kStoredCredentialVersion};
};

class CredentialBackend {
 public:
  virtual ~CredentialBackend() = default;
  virtual std::optional<StoredCredential> Load() = 0;
  virtual void Save(const StoredCredential& record) = 0;
  virtual void Clear() = 0;
};

class InMemoryCredentialBackend final : public CredentialBackend {
 public:
  InMemoryCredentialBackend() = default;
  explicit InMemoryCredentialBackend(StoredCredential initial) : record_(std::move(initial)) {}

  std::optional<StoredCredential> Load() override;
  void Save(const StoredCredential& record) override;
  void Clear() override;

 private:
  std::mutex mutex_;
  std::optional<StoredCredential> record_;
};

// `key=value` lines (pin_hash, secure, version), replaced atomically on save.
class FileCredentialBackend final : public CredentialBackend {
 public:
  explicit FileCredentialBackend(std::filesystem::path path) : path_(std::move(path)) {}

  std::optional<StoredCredential> Load() override;
  void Save(const StoredCredential& record) override;
  void Clear() override;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::filesystem::path path_;
};

struct VerifyOutcome {
  bool matched{false};
  bool migrated{false};  // a legacy record was re-hashed into the current format
};

// Owns the single local credential. Verification of a legacy record that
// succeeds re-hashes and saves it in the current format before returning.
class CredentialStore {
 public:
  CredentialStore(CredentialBackend& backend, const CredentialHasher& hasher,
                  std::size_t pin_length = kDefaultPinLength);

  [[nodiscard]] bool HasCredential();
  [[nodiscard]] std::optional<Credential> Current();

  // First enrollment or forced reset. Validates both entries before hashing.
  void SetPin(std::string_view pin, std::string_view confirmation);

  // Re-salts under a new PIN. The current PIN must verify first.
  void ChangePin(std::string_view current, std::string_view next, std::string_view confirmation);

  [[nodiscard]] VerifyOutcome Verify(std::string_view pin);

  // Full data reset. The only path that deletes the credential.
  void Clear();

  [[nodiscard]] std::size_t pin_length() const noexcept { return pin_length_; }

 private:
  void Store(const Credential& credential);
  std::optional<StoredCredential> LoadRecord();

  CredentialBackend& backend_;
  const CredentialHasher& hasher_;
  std::size_t pin_length_;
};

}  // namespace kt::auth
