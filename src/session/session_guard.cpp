#include "kt/session/session_guard.h"

#include <string>

#include "kt/auth/pin_policy.h"
#include "kt/crypto/ct.h"
#include "kt/error.h"
#include "kt/errors.h"

namespace kt::session {

using kt::logging::AuditEventType;
using kt::logging::AuditSeverity;

const char* ToString(SessionState state) {
  switch (state) {
    case SessionState::kActive:
      return "active";
    case SessionState::kLocked:
      return "locked";
  }
  return "locked";
}

SessionGuard::SessionGuard(kt::auth::CredentialStore& credentials, kt::auth::LockoutPolicy& lockout,
                           TimerQueue& timers, kt::logging::AuditLog& audit, SessionSettings settings)
    : credentials_(credentials),
      lockout_(lockout),
      audit_(audit),
      settings_(settings),
      idle_timer_(timers) {
  RefreshEnrollment();
  Rearm();
}

SessionGuard::~SessionGuard() { Stop(); }

void SessionGuard::RefreshEnrollment() {
  enrolled_ = credentials_.HasCredential();
}

bool SessionGuard::IdleLockApplies() const noexcept {
  return settings_.auto_lock_enabled && settings_.onboarding_complete && enrolled_ &&
         settings_.idle_timeout > std::chrono::milliseconds::zero();
}

void SessionGuard::Rearm() {
  idle_timer_.Cancel();
  if (state_ != SessionState::kActive || !IdleLockApplies()) {
    return;
  }
  idle_timer_.Reset(settings_.idle_timeout, [this]() { HandleIdleTimeout(); });
}

void SessionGuard::Configure(SessionSettings settings) {
  idle_timer_.Cancel();
  settings_ = settings;
  RefreshEnrollment();
  Rearm();
}

void SessionGuard::NotifyActivity(ActivityKind) {
  if (state_ == SessionState::kLocked) {
    return;
  }
  Rearm();
}

void SessionGuard::HandleIdleTimeout() {
  if (state_ != SessionState::kActive) {
    return;
  }
  Transition(SessionState::kLocked);
  audit_.Record(AuditEventType::kSessionTimeout, AuditSeverity::kInfo,
                std::string(kt::errors::msg::kSessionTimeout));
  NotifyStateChange(SessionState::kLocked);
}

bool SessionGuard::Transition(SessionState next) noexcept {
  if (state_ == next) {
    return false;
  }
  state_ = next;
  return true;
}

void SessionGuard::NotifyStateChange(SessionState state) const {
  if (on_state_change) {
    on_state_change(state);
  }
}

kt::auth::VerifyOutcome SessionGuard::VerifyWithLockout(std::string_view pin) {
  lockout_.EnsureNotLockedOut();
  const auto outcome = credentials_.Verify(pin);
  if (!outcome.matched) {
    const auto state = lockout_.RecordFailure();
    audit_.Record(AuditEventType::kAuthFailure, AuditSeverity::kWarning,
                  std::string(kt::errors::msg::kInvalidPinAttempt),
                  {kt::logging::EventField("failed_attempts", std::to_string(state.failed_attempts),
                                           kt::logging::FieldPrivacy::kPublic, true)});
    throw kt::AuthenticationFailureError(std::string(kt::errors::msg::kPinMismatch));
  }
  lockout_.RecordSuccess();
  if (outcome.migrated) {
    audit_.Record(AuditEventType::kSettingsChange, AuditSeverity::kInfo,
                  std::string(kt::errors::msg::kCredentialUpgraded));
  }
  return outcome;
}

void SessionGuard::Unlock(std::string_view pin, std::string_view method) {
  if (state_ == SessionState::kActive) {
    return;
  }
  kt::auth::EnforcePinPolicy(pin, credentials_.pin_length());
  (void)VerifyWithLockout(pin);
  enrolled_ = true;
  Transition(SessionState::kActive);
  Rearm();
  audit_.Record(AuditEventType::kAuthSuccess, AuditSeverity::kInfo,
                std::string(kt::errors::msg::kSessionUnlocked) + std::string(method));
  NotifyStateChange(SessionState::kActive);
}

void SessionGuard::ChangePin(std::string_view current, std::string_view next,
                             std::string_view confirmation) {
  if (state_ == SessionState::kLocked) {
    throw kt::Error{kt::ErrorDomain::State, kt::errors::state::kSessionLocked,
                    std::string(kt::errors::msg::kSessionLocked)};
  }
  kt::auth::EnforcePinPolicy(current, credentials_.pin_length());
  kt::auth::EnforcePinPolicy(next, credentials_.pin_length());
  if (!kt::crypto::ct::StringCompare(next, confirmation)) {
    throw kt::ValidationError(std::string(kt::errors::msg::kPinConfirmationMismatch));
  }
  (void)VerifyWithLockout(current);
  credentials_.SetPin(next, confirmation);
  audit_.Record(AuditEventType::kSettingsChange, AuditSeverity::kInfo,
                std::string(kt::errors::msg::kPinChanged));
  Rearm();
}

void SessionGuard::Lock() {
  idle_timer_.Cancel();
  if (Transition(SessionState::kLocked)) {
    NotifyStateChange(SessionState::kLocked);
  }
}

void SessionGuard::Stop() noexcept {
  idle_timer_.Cancel();
}

}  // namespace kt::session
