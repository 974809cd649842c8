#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

#include "kt/auth/credential_store.h"
#include "kt/auth/lockout_policy.h"
#include "kt/logging/audit.h"
#include "kt/session/timer_queue.h"

namespace kt::session {

enum class SessionState { kActive, kLocked };

enum class ActivityKind { kPointer, kKeyboard, kScroll };

const char* ToString(SessionState state);

struct SessionSettings {
  bool auto_lock_enabled{true};
  std::chrono::milliseconds idle_timeout{60'000};
  bool onboarding_complete{true};
};

// Idle auto-lock for the single local session. Starts ACTIVE (the caller has
// just unlocked or enrolled). Holds exactly one idle timer, and only while
// auto-lock is enabled, onboarding is complete and a PIN is enrolled.
class SessionGuard {
 public:
  SessionGuard(kt::auth::CredentialStore& credentials, kt::auth::LockoutPolicy& lockout,
               TimerQueue& timers, kt::logging::AuditLog& audit, SessionSettings settings = {});
  ~SessionGuard();

  SessionGuard(const SessionGuard&) = delete;
  SessionGuard& operator=(const SessionGuard&) = delete;

  // Cancels before re-arming and re-reads whether a PIN is enrolled. Disabling
  // never locks an active session.
  void Configure(SessionSettings settings);

  // Restarts the idle countdown while ACTIVE; ignored while LOCKED.
  void NotifyActivity(ActivityKind kind);

  // LOCKED -> ACTIVE on a matching PIN. Throws kt::ValidationError,
  // kt::LockedOutError or kt::AuthenticationFailureError and stays LOCKED.
  // A no-op while ACTIVE.
  void Unlock(std::string_view pin, std::string_view method = "PIN");

  // Re-keys the credential under the same lockout rules as Unlock.
  void ChangePin(std::string_view current, std::string_view next, std::string_view confirmation);

  void Lock();
  void Stop() noexcept;

  [[nodiscard]] SessionState State() const noexcept { return state_; }
  [[nodiscard]] bool IsLocked() const noexcept { return state_ == SessionState::kLocked; }
  [[nodiscard]] bool TimerArmed() const noexcept { return idle_timer_.armed(); }
  [[nodiscard]] const SessionSettings& settings() const noexcept { return settings_; }

  // Runs after the timer and audit trail already reflect the new state, so a
  // throwing observer cannot leave either behind.
  std::function<void(SessionState)> on_state_change;

 private:
  void RefreshEnrollment();
  bool IdleLockApplies() const noexcept;
  void Rearm();
  void HandleIdleTimeout();
  bool Transition(SessionState next) noexcept;
  void NotifyStateChange(SessionState state) const;
  kt::auth::VerifyOutcome VerifyWithLockout(std::string_view pin);

  kt::auth::CredentialStore& credentials_;
  kt::auth::LockoutPolicy& lockout_;
  kt::logging::AuditLog& audit_;
  SessionSettings settings_;
  SessionState state_{SessionState::kActive};
  bool enrolled_{false};
  ScopedTimer idle_timer_;
};

}  // namespace kt::session
