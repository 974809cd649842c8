#pragma once

#include <string_view>

namespace kt::errors::msg {
// centralized message catalog
inline constexpr std::string_view kPinWrongLength{"PIN has the wrong length"};
inline constexpr std::string_view kPinNotNumeric{"PIN must contain only digits"};
inline constexpr std::string_view kPinMismatch{"Invalid PIN"};
inline constexpr std::string_view kPinConfirmationMismatch{"PINs do not match"};
inline constexpr std::string_view kCurrentPinMismatch{"Current PIN is incorrect"};
inline constexpr std::string_view kCredentialNotEnrolled{"No PIN has been set"};
inline constexpr std::string_view kCredentialAlreadyEnrolled{"A PIN is already set; use change-pin"};
inline constexpr std::string_view kCredentialRecordMalformed{"Stored credential record is malformed"};
inline constexpr std::string_view kLockedOut{"Too many failed attempts. Try again in "};
inline constexpr std::string_view kPermissionDenied{"Permission denied: "};
inline constexpr std::string_view kRateLimitExceeded{"Rate limit exceeded. Try again in "};
inline constexpr std::string_view kUnknownRateBudget{"Unknown rate limit budget"};
inline constexpr std::string_view kUnknownPermission{"Unknown permission"};
inline constexpr std::string_view kUnknownRole{"Unknown role"};
inline constexpr std::string_view kPersistStateFailed{"Failed to persist shared security state"};
inline constexpr std::string_view kReadStateFailed{"Failed to read shared security state"};
inline constexpr std::string_view kIpcLockUnavailable{"Unable to acquire cross-process state lock"};
inline constexpr std::string_view kAtomicReplaceFailed{"Atomic file replace failed"};
inline constexpr std::string_view kRandomUnavailable{"System random source unavailable"};
inline constexpr std::string_view kSessionTimeout{"Session timeout - Auto lock engaged"};
inline constexpr std::string_view kSessionUnlocked{"User successfully unlocked session via "};
inline constexpr std::string_view kSessionLocked{"Session is locked"};
inline constexpr std::string_view kPinChanged{"PIN changed"};
inline constexpr std::string_view kCredentialUpgraded{"Stored PIN upgraded to salted PBKDF2"};
inline constexpr std::string_view kInvalidPinAttempt{"Invalid PIN attempt detected"};
inline constexpr std::string_view kPinEnrolled{"PIN enrolled"};
inline constexpr std::string_view kDataReset{"All local security state erased"};
}  // namespace kt::errors::msg
