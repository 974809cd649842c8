#include "kt/auth/credential_store.h"

#include <charconv>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>

#include "kt/common.h"
#include "kt/crypto/ct.h"
#include "kt/error.h"
#include "kt/errors.h"
#include "kt/security/zeroizer.h"
#include "kt/store/io_util.h"

namespace kt::auth {
namespace {

constexpr std::string_view kHashKey{"pin_hash"};
constexpr std::string_view kSecureKey{"secure"};
constexpr std::string_view kVersionKey{"version"};

[[noreturn]] void ThrowMalformed(const std::filesystem::path& path, std::string_view detail) {
  throw kt::Error{kt::ErrorDomain::IO, kt::errors::io::kStateReadFailed,
                  std::string(kt::errors::msg::kCredentialRecordMalformed) + ": " +
                      kt::PathToUtf8String(path) + ": " + std::string(detail)};
}

std::string_view Trim(std::string_view text) {
  const auto begin = text.find_first_not_of(" \t\r");
  if (begin == std::string_view::npos) {
    return {};
  }
  const auto end = text.find_last_not_of(" \t\r");
  return text.substr(begin, end - begin + 1);
}

}  // namespace

std::optional<StoredCredential> InMemoryCredentialBackend::Load() {
  std::lock_guard<std::mutex> guard(mutex_);
  return record_;
}

void InMemoryCredentialBackend::Save(const StoredCredential& record) {
  std::lock_guard<std::mutex> guard(mutex_);
  record_ = record;
}

void InMemoryCredentialBackend::Clear() {
  std::lock_guard<std::mutex> guard(mutex_);
  if (record_) {
    kt::security::Zeroizer::WipeString(record_->serialized);
  }
  record_.reset();
}

std::optional<StoredCredential> FileCredentialBackend::Load() {
  auto bytes = kt::store::ReadFileBytes(path_);
  if (!bytes) {
    return std::nullopt;
  }
  std::string text(bytes->begin(), bytes->end());
  std::istringstream in(text);
  std::string raw;
  StoredCredential record;
  bool have_hash = false;
  while (std::getline(in, raw)) {
    const auto line = Trim(raw);
    if (line.empty() || line.front() == '#') {
      continue;
    }
    const auto eq = line.find('=');
    if (eq == std::string_view::npos) {
      ThrowMalformed(path_, "line without '='");
    }
    const auto key = Trim(line.substr(0, eq));
    const auto value = Trim(line.substr(eq + 1));
    if (key == kHashKey) {
      record.serialized = std::string(value);
      have_hash = true;
    } else if (key == kSecureKey) {
      if (value != "0" && value != "1") {
        ThrowMalformed(path_, "secure must be 0 or 1");
      }
      record.secure = value == "1";
    } else if (key == kVersionKey) {
      uint32_t version = 0;
      auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), version);
      if (ec != std::errc() || ptr != value.data() + value.size()) {
        ThrowMalformed(path_, "version is not a number");
      }
      record.version = version;
    }
  }
  kt::security::Zeroizer::WipeString(text);
  if (!have_hash || record.serialized.empty()) {
    ThrowMalformed(path_, "missing pin_hash");
  }
  return record;
}

void FileCredentialBackend::Save(const StoredCredential& record) {
  std::string payload;
  payload.append(kHashKey).append("=").append(record.serialized).append("\n");
  payload.append(kSecureKey).append("=").append(record.secure ? "1" : "0").append("\n");
  payload.append(kVersionKey).append("=").append(std::to_string(record.version)).append("\n");
  kt::store::AtomicReplace(path_, kt::AsBytes(payload));
  kt::security::Zeroizer::WipeString(payload);
}

void FileCredentialBackend::Clear() {
  kt::store::RemoveFileIfExists(path_);
}

CredentialStore::CredentialStore(CredentialBackend& backend, const CredentialHasher& hasher,
                                 std::size_t pin_length)
    : backend_(backend), hasher_(hasher), pin_length_(pin_length) {}

std::optional<StoredCredential> CredentialStore::LoadRecord() {
  return backend_.Load();
}

bool CredentialStore::HasCredential() {
  return LoadRecord().has_value();
}

std::optional<Credential> CredentialStore::Current() {
  auto record = LoadRecord();
  if (!record) {
    return std::nullopt;
  }
  return CredentialHasher::Parse(record->serialized);
}

void CredentialStore::Store(const Credential& credential) {
  StoredCredential record;
  record.serialized = credential.Serialize();
  record.secure = credential.IsSecure();
  record.version = kStoredCredentialVersion;
  backend_.Save(record);
  kt::security::Zeroizer::WipeString(record.serialized);
}

void CredentialStore::SetPin(std::string_view pin, std::string_view confirmation) {
  EnforcePinPolicy(pin, pin_length_);
  if (!kt::crypto::ct::StringCompare(pin, confirmation)) {
    throw kt::ValidationError(std::string(kt::errors::msg::kPinConfirmationMismatch));
  }
  Store(hasher_.Hash(pin));
}

void CredentialStore::ChangePin(std::string_view current, std::string_view next,
                                std::string_view confirmation) {
  EnforcePinPolicy(next, pin_length_);
  if (!kt::crypto::ct::StringCompare(next, confirmation)) {
    throw kt::ValidationError(std::string(kt::errors::msg::kPinConfirmationMismatch));
  }
  if (!Verify(current).matched) {
    throw kt::AuthenticationFailureError(std::string(kt::errors::msg::kCurrentPinMismatch));
  }
  Store(hasher_.Hash(next));
}

VerifyOutcome CredentialStore::Verify(std::string_view pin) {
  auto record = LoadRecord();
  if (!record) {
    throw kt::ValidationError(std::string(kt::errors::msg::kCredentialNotEnrolled),
                              kt::errors::validation::kCredentialMissing);
  }
  VerifyOutcome outcome;
  const auto format = CredentialHasher::DetectFormat(record->serialized);
  if (record->secure && format != CredentialFormat::kPbkdf2Sha256) {
    // A record flagged secure must never be checked against a weaker format.
    std::clog << "[auth] " << kt::errors::msg::kCredentialRecordMalformed
              << ": secure flag set on a legacy value" << std::endl;
    kt::security::Zeroizer::WipeString(record->serialized);
    return outcome;
  }
  outcome.matched = hasher_.Verify(pin, record->serialized);
  kt::security::Zeroizer::WipeString(record->serialized);
  if (!outcome.matched || format == CredentialFormat::kPbkdf2Sha256) {
    return outcome;
  }
  try {
    Store(hasher_.Hash(pin));
    outcome.migrated = true;
  } catch (const kt::Error& err) {
    // The legacy record stays valid; migration is retried on the next success.
    std::clog << "[auth] credential migration deferred: " << err.what() << std::endl;
  }
  return outcome;
}

void CredentialStore::Clear() {
  backend_.Clear();
}

}  // namespace kt::auth
