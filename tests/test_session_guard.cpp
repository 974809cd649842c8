#include "kt/session/session_guard.h"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "kt/error.h"
#include "kt/logging/audit.h"
#include "kt/logging/event_bus.h"

namespace {

using kt::logging::AuditEvent;
using kt::logging::AuditEventType;
using kt::logging::AuditSeverity;

// Wraps the in-memory backend so a test can make the store unreachable.
class FlakyBackend final : public kt::auth::CredentialBackend {
public:
  std::optional<kt::auth::StoredCredential> Load() override {
    if (fail) {
      throw kt::Error{kt::ErrorDomain::IO, kt::errors::io::kStateReadFailed, "backend offline"};
    }
    return inner.Load();
  }
  void Save(const kt::auth::StoredCredential& record) override { inner.Save(record); }
  void Clear() override { inner.Clear(); }

  kt::auth::InMemoryCredentialBackend inner;
  bool fail{false};
};

struct Harness {
  Harness() : lockout(lockout_store, clock), timers(clock), audit(bus, clock) {
    bus.Subscribe([this](const kt::logging::Event& event) {
      if (auto record = kt::logging::AuditEventFromBusEvent(event)) {
        events.push_back(*record);
      }
    });
  }

  size_t Count(AuditEventType type) const {
    size_t n = 0;
    for (const auto& event : events) {
      n += event.type == type ? 1 : 0;
    }
    return n;
  }

  kt::ManualClock clock;
  kt::auth::CredentialHasher hasher;
  FlakyBackend backend;
  kt::auth::InMemoryLockoutStore lockout_store;
  kt::auth::LockoutPolicy lockout;
  kt::session::TimerQueue timers;
  kt::logging::EventBus bus;
  kt::logging::AuditLog audit;
  std::vector<AuditEvent> events;
};

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

}  // namespace

int main() {
  using namespace std::chrono_literals;
  using kt::session::ActivityKind;
  using kt::session::SessionSettings;
  using kt::session::SessionState;

  Harness h;
  kt::auth::CredentialStore credentials(h.backend, h.hasher);

  {
    // No PIN enrolled: nothing to lock with, so no timer.
    kt::session::SessionGuard guard(credentials, h.lockout, h.timers, h.audit);
    assert(guard.State() == SessionState::kActive);
    assert(!guard.TimerArmed());
    h.clock.Advance(10min);
    h.timers.RunDue();
    assert(!guard.IsLocked());
  }
  assert(h.timers.Pending() == 0);

  credentials.SetPin("1234", "1234");

  kt::session::SessionGuard guard(credentials, h.lockout, h.timers, h.audit);
  std::vector<SessionState> transitions;
  guard.on_state_change = [&](SessionState state) { transitions.push_back(state); };
  assert(guard.TimerArmed());
  assert(h.timers.Pending() == 1);

  // Activity restarts the countdown.
  h.clock.Advance(59s);
  h.timers.RunDue();
  guard.NotifyActivity(ActivityKind::kKeyboard);
  h.clock.Advance(59s);
  h.timers.RunDue();
  assert(!guard.IsLocked());
  guard.NotifyActivity(ActivityKind::kScroll);
  assert(h.timers.Pending() == 1);

  h.clock.Advance(60s);
  h.timers.RunDue();
  assert(guard.IsLocked());
  assert(!guard.TimerArmed());
  assert(h.Count(AuditEventType::kSessionTimeout) == 1);
  assert(h.events.back().severity == AuditSeverity::kInfo);
  assert(h.events.back().detail == "Session timeout - Auto lock engaged");
  assert((transitions == std::vector<SessionState>{SessionState::kLocked}));

  // Activity while locked changes nothing.
  guard.NotifyActivity(ActivityKind::kPointer);
  assert(!guard.TimerArmed());
  assert(guard.IsLocked());

  // Malformed input is rejected before verification and is not a failed attempt.
  assert(Throws<kt::ValidationError>([&] { guard.Unlock("12a4"); }));
  assert(Throws<kt::ValidationError>([&] { guard.Unlock("123"); }));
  assert(h.lockout.Snapshot().failed_attempts == 0);
  assert(h.Count(AuditEventType::kAuthFailure) == 0);

  // Wrong PINs are audited and counted; the third engages the lockout.
  for (int i = 0; i < 3; ++i) {
    assert(Throws<kt::AuthenticationFailureError>([&] { guard.Unlock("0000"); }));
    assert(guard.IsLocked());
  }
  assert(h.Count(AuditEventType::kAuthFailure) == 3);
  assert(h.events.back().severity == AuditSeverity::kWarning);
  assert(h.events.back().detail == "Invalid PIN attempt detected");
  assert(h.lockout.Snapshot().failed_attempts == 3);

  // Even the right PIN is refused during the backoff.
  assert(Throws<kt::LockedOutError>([&] { guard.Unlock("1234"); }));
  assert(guard.IsLocked());

  // Backend trouble leaves the session locked.
  h.clock.Advance(1s);
  h.backend.fail = true;
  assert(Throws<kt::Error>([&] { guard.Unlock("1234"); }));
  assert(guard.IsLocked());
  h.backend.fail = false;

  guard.Unlock("1234", "Biometric");
  assert(guard.State() == SessionState::kActive);
  assert(guard.TimerArmed());
  assert(h.lockout.Snapshot().failed_attempts == 0);
  assert(h.Count(AuditEventType::kAuthSuccess) == 1);
  assert(h.events.back().detail == "User successfully unlocked session via Biometric");
  assert(h.events.back().severity == AuditSeverity::kInfo);
  assert(transitions.size() == 2 && transitions.back() == SessionState::kActive);

  // Unlock while active is a no-op.
  const auto before = h.events.size();
  guard.Unlock("1234");
  assert(h.events.size() == before);

  // Enable/disable cycles never leave more than one timer behind.
  SessionSettings settings;
  for (int i = 0; i < 10; ++i) {
    settings.auto_lock_enabled = (i % 2) == 0;
    guard.Configure(settings);
    assert(h.timers.Pending() == (settings.auto_lock_enabled ? 1u : 0u));
  }
  settings.auto_lock_enabled = false;
  guard.Configure(settings);
  h.clock.Advance(1h);
  h.timers.RunDue();
  assert(!guard.IsLocked());

  // Incomplete onboarding suppresses idle locking as well.
  settings.auto_lock_enabled = true;
  settings.onboarding_complete = false;
  guard.Configure(settings);
  assert(!guard.TimerArmed());
  settings.onboarding_complete = true;
  settings.idle_timeout = 5s;
  guard.Configure(settings);
  assert(guard.TimerArmed());
  h.clock.Advance(5s);
  h.timers.RunDue();
  assert(guard.IsLocked());

  // PIN changes need an unlocked session.
  bool locked_error = false;
  try {
    guard.ChangePin("1234", "5678", "5678");
  } catch (const kt::Error& err) {
    locked_error = err.domain == kt::ErrorDomain::State &&
                   err.code == kt::errors::state::kSessionLocked;
  }
  assert(locked_error);

  guard.Unlock("1234");
  assert(Throws<kt::AuthenticationFailureError>([&] { guard.ChangePin("9999", "5678", "5678"); }));
  assert(h.lockout.Snapshot().failed_attempts == 1);
  // A confirmation typo is caught before the current PIN is checked.
  assert(Throws<kt::ValidationError>([&] { guard.ChangePin("1234", "5678", "5679"); }));
  assert(h.lockout.Snapshot().failed_attempts == 1);
  guard.ChangePin("1234", "5678", "5678");
  assert(h.lockout.Snapshot().failed_attempts == 0);
  assert(h.Count(AuditEventType::kSettingsChange) == 1);
  assert(h.events.back().detail == "PIN changed");
  assert(credentials.Verify("5678").matched);

  guard.Lock();
  assert(guard.IsLocked());
  assert(!guard.TimerArmed());
  guard.Stop();
  assert(h.timers.Pending() == 0);

  {
    // A legacy record is upgraded during unlock and the upgrade is audited.
    Harness legacy;
    legacy.backend.inner.Save(kt::auth::StoredCredential{"wcoy", false, 1});
    kt::auth::CredentialStore legacy_credentials(legacy.backend, legacy.hasher);
    kt::session::SessionGuard legacy_guard(legacy_credentials, legacy.lockout, legacy.timers,
                                           legacy.audit);
    legacy_guard.Lock();
    legacy_guard.Unlock("1234");
    assert(!legacy_guard.IsLocked());
    assert(legacy.Count(AuditEventType::kSettingsChange) == 1);
    assert(legacy.backend.inner.Load()->secure);
  }

  {
    // An observer that throws still sees a session whose timer and audit trail are current.
    Harness loud;
    kt::auth::CredentialStore loud_credentials(loud.backend, loud.hasher);
    loud_credentials.SetPin("1234", "1234");
    kt::session::SessionGuard loud_guard(loud_credentials, loud.lockout, loud.timers, loud.audit);
    loud_guard.on_state_change = [](SessionState) { throw std::runtime_error("observer failed"); };

    assert(Throws<std::runtime_error>([&] { loud_guard.Lock(); }));
    assert(loud_guard.IsLocked());
    assert(!loud_guard.TimerArmed());

    assert(Throws<std::runtime_error>([&] { loud_guard.Unlock("1234"); }));
    assert(!loud_guard.IsLocked());
    assert(loud_guard.TimerArmed());
    assert(loud.Count(AuditEventType::kAuthSuccess) == 1);

    loud.clock.Advance(loud_guard.settings().idle_timeout);
    assert(Throws<std::runtime_error>([&] { loud.timers.RunDue(); }));
    assert(loud_guard.IsLocked());
    assert(loud.Count(AuditEventType::kSessionTimeout) == 1);
  }

  std::cout << "session guard tests ok\n";
  return 0;
}
