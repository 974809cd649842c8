#include "kt/config.h"

#include <charconv>
#include <cstdlib>
#include <limits>

#include "kt/error.h"
#include "kt/errors.h"

namespace kt {
namespace {

constexpr std::size_t kMinPinLength = 4;
constexpr std::size_t kMaxPinLength = 12;

[[noreturn]] void ThrowInvalid(std::string_view key, std::string_view value, std::string_view why) {
  throw Error{ErrorDomain::Config, errors::config::kInvalidValue,
              "Invalid value for " + std::string(key) + ": " + std::string(why), std::nullopt,
              Retryability::kFatal, {std::string(key), std::string(value)}};
}

bool ParseBool(std::string_view key, std::string_view value) {
  if (value == "1" || value == "true" || value == "on" || value == "yes") {
    return true;
  }
  if (value == "0" || value == "false" || value == "off" || value == "no") {
    return false;
  }
  ThrowInvalid(key, value, "expected a boolean");
}

uint64_t ParseUnsigned(std::string_view key, std::string_view value, uint64_t min, uint64_t max) {
  uint64_t parsed = 0;
  const auto* begin = value.data();
  const auto* end = value.data() + value.size();
  auto result = std::from_chars(begin, end, parsed, 10);
  if (value.empty() || result.ec != std::errc{} || result.ptr != end) {
    ThrowInvalid(key, value, "expected a decimal integer");
  }
  if (parsed < min || parsed > max) {
    ThrowInvalid(key, value,
                 "must be between " + std::to_string(min) + " and " + std::to_string(max));
  }
  return parsed;
}

// Shared by the environment and the flag parser; `key` is the flag spelling.
bool ApplySetting(Config& config, std::string_view key, std::string_view value) {
  if (key == "auto-lock") {
    config.auto_lock_enabled = ParseBool(key, value);
  } else if (key == "idle-timeout-ms") {
    // Zero disables idle locking the same way auto-lock=0 does.
    config.idle_timeout = std::chrono::milliseconds(
        ParseUnsigned(key, value, 0, static_cast<uint64_t>(std::numeric_limits<int32_t>::max())));
  } else if (key == "onboarding-complete") {
    config.onboarding_complete = ParseBool(key, value);
  } else if (key == "max-backoff-seconds") {
    config.max_backoff = std::chrono::seconds(ParseUnsigned(key, value, 1, 86'400));
  } else if (key == "pin-length") {
    config.pin_length = static_cast<std::size_t>(ParseUnsigned(key, value, kMinPinLength, kMaxPinLength));
  } else if (key == "state-dir") {
    if (value.empty() || value.find('\0') != std::string_view::npos) {
      ThrowInvalid(key, value, "expected a path");
    }
    config.state_dir = std::filesystem::path(std::string(value));
  } else if (key == "privacy-mode") {
    config.privacy_mode = ParseBool(key, value);
  } else if (key == "subject-name") {
    config.subject_name = std::string(value);
  } else {
    return false;
  }
  return true;
}

struct EnvBinding {
  std::string_view variable;
  std::string_view key;
};

constexpr EnvBinding kEnvBindings[] = {
    {"KT_AUTO_LOCK", "auto-lock"},
    {"KT_IDLE_TIMEOUT_MS", "idle-timeout-ms"},
    {"KT_ONBOARDING_COMPLETE", "onboarding-complete"},
    {"KT_MAX_BACKOFF_SECONDS", "max-backoff-seconds"},
    {"KT_PIN_LENGTH", "pin-length"},
    {"KT_STATE_DIR", "state-dir"},
    {"KT_PRIVACY_MODE", "privacy-mode"},
    {"KT_SUBJECT_NAME", "subject-name"},
};

}  // namespace

session::SessionSettings Config::Session() const {
  session::SessionSettings settings;
  settings.auto_lock_enabled = auto_lock_enabled;
  settings.idle_timeout = idle_timeout;
  settings.onboarding_complete = onboarding_complete;
  return settings;
}

auth::LockoutOptions Config::Lockout() const {
  auth::LockoutOptions options;
  options.max_backoff = max_backoff;
  return options;
}

privacy::RedactionConfig Config::Redaction() const {
  privacy::RedactionConfig redaction;
  redaction.privacy_mode = privacy_mode;
  redaction.subject_name = subject_name;
  return redaction;
}

std::filesystem::path DefaultStateDir(const EnvLookup& env) {
  if (auto xdg = env("XDG_STATE_HOME"); xdg && !xdg->empty()) {
    return std::filesystem::path(*xdg) / "kintrust";
  }
  if (auto home = env("HOME"); home && !home->empty()) {
    return std::filesystem::path(*home) / ".local" / "state" / "kintrust";
  }
  return std::filesystem::path(".kintrust");
}

Config LoadConfig(const EnvLookup& env) {
  Config config;
  for (const auto& binding : kEnvBindings) {
    if (auto value = env(binding.variable)) {
      ApplySetting(config, binding.key, *value);
    }
  }
  if (config.state_dir.empty()) {
    config.state_dir = DefaultStateDir(env);
  }
  return config;
}

Config LoadConfigFromEnvironment() {
  return LoadConfig([](std::string_view name) -> std::optional<std::string> {
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  });
}

std::vector<std::string> ApplyOverrides(Config& config, const std::vector<std::string>& args) {
  std::vector<std::string> rest;
  for (const auto& arg : args) {
    std::string_view view(arg);
    if (view.rfind("--", 0) != 0) {
      rest.push_back(arg);
      continue;
    }
    const auto eq = view.find('=');
    if (eq == std::string_view::npos) {
      rest.push_back(arg);
      continue;
    }
    if (!ApplySetting(config, view.substr(2, eq - 2), view.substr(eq + 1))) {
      rest.push_back(arg);
    }
  }
  return rest;
}

}  // namespace kt
