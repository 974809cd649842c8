#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kt/auth/lockout_policy.h"
#include "kt/privacy/privacy_redactor.h"
#include "kt/session/session_guard.h"

namespace kt {

struct Config {
  bool auto_lock_enabled{true};
  std::chrono::milliseconds idle_timeout{60'000};
  bool onboarding_complete{true};
  std::chrono::seconds max_backoff{300};
  std::size_t pin_length{4};
  std::filesystem::path state_dir;
  bool privacy_mode{false};
  std::string subject_name;

  [[nodiscard]] session::SessionSettings Session() const;
  [[nodiscard]] auth::LockoutOptions Lockout() const;
  [[nodiscard]] privacy::RedactionConfig Redaction() const;

  [[nodiscard]] std::filesystem::path CredentialPath() const { return state_dir / "credential"; }
  [[nodiscard]] std::filesystem::path LockoutPath() const { return state_dir / "lockout.state"; }
  [[nodiscard]] std::filesystem::path RateLimitDir() const { return state_dir / "ratelimit"; }
  [[nodiscard]] std::filesystem::path AuditLogPath() const { return state_dir / "audit.jsonl"; }
};

using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

// Platform default: $XDG_STATE_HOME/kintrust, else $HOME/.local/state/kintrust,
// else ./.kintrust.
std::filesystem::path DefaultStateDir(const EnvLookup& env);

// Reads KT_AUTO_LOCK, KT_IDLE_TIMEOUT_MS, KT_ONBOARDING_COMPLETE,
// KT_MAX_BACKOFF_SECONDS, KT_PIN_LENGTH, KT_STATE_DIR, KT_PRIVACY_MODE and
// KT_SUBJECT_NAME. Unset variables keep their defaults; malformed ones throw
// kt::Error{Config}.
Config LoadConfigFromEnvironment();
Config LoadConfig(const EnvLookup& env);

// Applies `--key=value` flags (auto-lock, idle-timeout-ms, onboarding-complete,
// max-backoff-seconds, pin-length, state-dir, privacy-mode, subject-name).
// Returns the arguments it did not consume, in order.
std::vector<std::string> ApplyOverrides(Config& config, const std::vector<std::string>& args);

}  // namespace kt
