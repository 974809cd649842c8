#include "kt/error.h"
#include "kt/errors.h"
#include "kt/security/zeroizer.h"

#include <array>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <set>
#include <span>
#include <string>
#include <vector>

#include "kt/store/io_util.h"

namespace {

  void TestCodeRanges() {
    using kt::ErrorDomain;
    const std::initializer_list<std::pair<ErrorDomain, int>> codes = {
        {ErrorDomain::Security, kt::errors::security::kAuthenticationRejected},
        {ErrorDomain::Security, kt::errors::security::kLockedOut},
        {ErrorDomain::Security, kt::errors::security::kPermissionDenied},
        {ErrorDomain::Security, kt::errors::security::kStateTampered},
        {ErrorDomain::Validation, kt::errors::validation::kPinFormat},
        {ErrorDomain::Validation, kt::errors::validation::kCredentialMissing},
        {ErrorDomain::Validation, kt::errors::validation::kUnknownPermission},
        {ErrorDomain::Validation, kt::errors::validation::kUnknownRole},
        {ErrorDomain::Validation, kt::errors::validation::kCredentialExists},
        {ErrorDomain::IO, kt::errors::io::kStateReadFailed},
        {ErrorDomain::IO, kt::errors::io::kStateWriteFailed},
        {ErrorDomain::IO, kt::errors::io::kIpcLockUnavailable},
        {ErrorDomain::IO, kt::errors::io::kPinReadFailed},
        {ErrorDomain::Config, kt::errors::config::kInvalidValue},
        {ErrorDomain::Config, kt::errors::config::kUnknownBudget},
        {ErrorDomain::State, kt::errors::state::kRateLimited},
        {ErrorDomain::State, kt::errors::state::kSessionLocked},
    };
    std::set<int> seen;
    for (const auto& [domain, code] : codes) {
      assert(kt::IsFrameworkErrorCode(domain, code));
      assert(seen.insert(code).second);
    }
    // Raw errno values never fall inside a framework range.
    assert(!kt::IsFrameworkErrorCode(ErrorDomain::IO, 2));
    assert(kt::ErrorDomainMax(ErrorDomain::Security) < kt::ErrorDomainBase(ErrorDomain::IO));
  }

  void TestTypedErrors() {
    using namespace std::chrono_literals;

    const kt::ValidationError validation("PIN must be 4 digits");
    assert(validation.domain == kt::ErrorDomain::Validation);
    assert(validation.code == kt::errors::validation::kPinFormat);
    assert(validation.retryability == kt::Retryability::kFatal);

    const kt::AuthenticationFailureError failure("Incorrect PIN");
    assert(failure.domain == kt::ErrorDomain::Security);
    assert(failure.retryability == kt::Retryability::kRetryable);

    const kt::LockedOutError locked("Too many failed attempts", 8s);
    assert(locked.code == kt::errors::security::kLockedOut);
    assert(locked.retryability == kt::Retryability::kTransient);
    assert(locked.remaining_seconds == 8s);

    const kt::RateLimitedError limited("Rate limit exceeded", "chat", 1500ms);
    assert(limited.domain == kt::ErrorDomain::State);
    assert(limited.budget == "chat");

    // Every typed error is catchable as the base.
    bool caught = false;
    try {
      throw kt::PermissionDeniedError("Permission denied", "u-1", "data:reset");
    } catch (const kt::Error& err) {
      caught = err.code == kt::errors::security::kPermissionDenied &&
               std::string(err.what()) == "Permission denied";
    }
    assert(caught);
  }

  void TestIoErrorsCarryContext() {
    // A directory where a file is expected surfaces as an IO error, not a crash.
    const auto dir = std::filesystem::temp_directory_path() /
                     ("kt_errors_" +
                      std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(dir / "occupied");
    bool io_error = false;
    try {
      (void)kt::store::ReadFileBytes(dir / "occupied");
    } catch (const kt::Error& err) {
      io_error = err.domain == kt::ErrorDomain::IO;
    }
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    assert(io_error);
  }

  void TestZeroizer() {
    std::array<uint8_t, 16> key{};
    key.fill(0xA5);
    {
      kt::security::Zeroizer::ScopeWiper<uint8_t> wiper(key.data(), key.size());
    }
    for (auto byte : key) {
      assert(byte == 0);
    }

    key.fill(0x5A);
    {
      kt::security::Zeroizer::ScopeWiper<uint8_t> kept(std::span<uint8_t>(key.data(), key.size()));
      kept.Release();
    }
    assert(key[0] == 0x5A && key[15] == 0x5A);

    std::vector<uint32_t> words = {1, 2, 3};
    kt::security::Zeroizer::WipeVector(words);
    assert(words.size() == 3 && words[0] == 0 && words[2] == 0);

    std::string pin = "123456789012";
    const char* storage = pin.data();
    pin.resize(4);
    kt::security::Zeroizer::WipeString(pin);
    assert(pin.empty());
    // Capacity is retained, so the old buffer is still ours to inspect.
    assert(pin.data() == storage);
    for (size_t i = 0; i < 12; ++i) {
      assert(storage[i] == '\0');
    }
  }

} // namespace

int main() {
  TestCodeRanges();
  TestTypedErrors();
  TestIoErrorsCarryContext();
  TestZeroizer();
  std::cout << "error handling tests ok\n";
  return 0;
}
