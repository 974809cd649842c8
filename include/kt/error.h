#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace kt {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes so propagated platform error numbers
  // never collide with framework codes.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace security {
      inline constexpr int kAuthenticationRejected = Make(ErrorDomain::Security, 0x01);
      inline constexpr int kLockedOut = Make(ErrorDomain::Security, 0x02);
      inline constexpr int kPermissionDenied = Make(ErrorDomain::Security, 0x03);
      inline constexpr int kStateTampered = Make(ErrorDomain::Security, 0x04);
    } // namespace security

    namespace validation {
      inline constexpr int kPinFormat = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kCredentialMissing = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kUnknownPermission = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kUnknownRole = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kCredentialExists = Make(ErrorDomain::Validation, 0x05);
    } // namespace validation

    namespace io {
      inline constexpr int kStateReadFailed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kStateWriteFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kIpcLockUnavailable = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kConsoleModeQueryFailed = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kConsoleEchoDisableFailed = Make(ErrorDomain::IO, 0x05);
      inline constexpr int kPinReadFailed = Make(ErrorDomain::IO, 0x06);
    } // namespace io

    namespace config {
      inline constexpr int kInvalidValue = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kUnknownBudget = Make(ErrorDomain::Config, 0x02);
    } // namespace config

    namespace state {
      inline constexpr int kRateLimited = Make(ErrorDomain::State, 0x01);
      inline constexpr int kSessionLocked = Make(ErrorDomain::State, 0x02);
    } // namespace state

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  // Malformed credential input, rejected before any hashing.
  struct ValidationError : public Error {
    explicit ValidationError(std::string msg, int c = errors::validation::kPinFormat)
        : Error(ErrorDomain::Validation, c, std::move(msg)) {}
  };

  // Verification mismatch. Retriable, subject to lockout.
  struct AuthenticationFailureError : public Error {
    explicit AuthenticationFailureError(std::string msg)
        : Error(ErrorDomain::Security, errors::security::kAuthenticationRejected, std::move(msg),
                std::nullopt, Retryability::kRetryable) {}
  };

  // Too many recent failures; retriable once remaining_seconds have elapsed.
  struct LockedOutError : public Error {
    std::chrono::seconds remaining_seconds;
    LockedOutError(std::string msg, std::chrono::seconds remaining)
        : Error(ErrorDomain::Security, errors::security::kLockedOut, std::move(msg), std::nullopt,
                Retryability::kTransient),
          remaining_seconds(remaining) {}
  };

  // Authorization failure at a mutation boundary. Fatal for the current action.
  struct PermissionDeniedError : public Error {
    std::string principal_id;
    std::string permission;
    PermissionDeniedError(std::string msg, std::string principal, std::string perm)
        : Error(ErrorDomain::Security, errors::security::kPermissionDenied, std::move(msg)),
          principal_id(std::move(principal)),
          permission(std::move(perm)) {}
  };

  struct RateLimitedError : public Error {
    std::string budget;
    std::chrono::milliseconds reset_in;
    RateLimitedError(std::string msg, std::string key, std::chrono::milliseconds reset)
        : Error(ErrorDomain::State, errors::state::kRateLimited, std::move(msg), std::nullopt,
                Retryability::kTransient),
          budget(std::move(key)),
          reset_in(reset) {}
  };
} // namespace kt
