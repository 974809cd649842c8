#include "kt/config.h"

#include <cassert>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "kt/error.h"

namespace {

kt::EnvLookup MapEnv(std::map<std::string, std::string> values) {
  return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
    auto it = values.find(std::string(name));
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

bool RejectsWithKey(const kt::EnvLookup& env, const std::string& key) {
  try {
    (void)kt::LoadConfig(env);
  } catch (const kt::Error& err) {
    return err.domain == kt::ErrorDomain::Config &&
           err.code == kt::errors::config::kInvalidValue && !err.context.empty() &&
           err.context.front() == key;
  }
  return false;
}

}  // namespace

int main() {
  using namespace std::chrono_literals;

  {
    auto config = kt::LoadConfig(MapEnv({{"HOME", "/home/carer"}}));
    assert(config.auto_lock_enabled);
    assert(config.idle_timeout == 60'000ms);
    assert(config.onboarding_complete);
    assert(config.max_backoff == 300s);
    assert(config.pin_length == 4);
    assert(!config.privacy_mode);
    assert(config.state_dir == std::filesystem::path("/home/carer/.local/state/kintrust"));
    assert(config.CredentialPath() == config.state_dir / "credential");
    assert(config.AuditLogPath() == config.state_dir / "audit.jsonl");
  }

  assert(kt::DefaultStateDir(MapEnv({{"XDG_STATE_HOME", "/var/xdg"}, {"HOME", "/home/carer"}})) ==
         std::filesystem::path("/var/xdg/kintrust"));
  assert(kt::DefaultStateDir(MapEnv({{"XDG_STATE_HOME", ""}, {"HOME", "/home/carer"}})) ==
         std::filesystem::path("/home/carer/.local/state/kintrust"));
  assert(kt::DefaultStateDir(MapEnv({})) == std::filesystem::path(".kintrust"));

  {
    auto config = kt::LoadConfig(MapEnv({{"KT_AUTO_LOCK", "off"},
                                         {"KT_IDLE_TIMEOUT_MS", "15000"},
                                         {"KT_ONBOARDING_COMPLETE", "no"},
                                         {"KT_MAX_BACKOFF_SECONDS", "600"},
                                         {"KT_PIN_LENGTH", "6"},
                                         {"KT_STATE_DIR", "/tmp/kt-state"},
                                         {"KT_PRIVACY_MODE", "1"},
                                         {"KT_SUBJECT_NAME", "Margaret"}}));
    assert(!config.auto_lock_enabled);
    assert(config.idle_timeout == 15s);
    assert(!config.onboarding_complete);
    assert(config.max_backoff == 600s);
    assert(config.pin_length == 6);
    assert(config.state_dir == std::filesystem::path("/tmp/kt-state"));

    const auto session = config.Session();
    assert(!session.auto_lock_enabled && !session.onboarding_complete);
    assert(session.idle_timeout == 15s);
    assert(config.Lockout().max_backoff == 600s);
    const auto redaction = config.Redaction();
    assert(redaction.privacy_mode && redaction.subject_name == "Margaret");
  }

  assert(RejectsWithKey(MapEnv({{"KT_AUTO_LOCK", "maybe"}}), "auto-lock"));
  assert(RejectsWithKey(MapEnv({{"KT_IDLE_TIMEOUT_MS", "-5"}}), "idle-timeout-ms"));
  assert(RejectsWithKey(MapEnv({{"KT_IDLE_TIMEOUT_MS", "10s"}}), "idle-timeout-ms"));
  assert(RejectsWithKey(MapEnv({{"KT_MAX_BACKOFF_SECONDS", "0"}}), "max-backoff-seconds"));
  assert(RejectsWithKey(MapEnv({{"KT_PIN_LENGTH", "3"}}), "pin-length"));
  assert(RejectsWithKey(MapEnv({{"KT_PIN_LENGTH", "13"}}), "pin-length"));
  assert(RejectsWithKey(MapEnv({{"KT_STATE_DIR", ""}}), "state-dir"));

  {
    kt::Config config = kt::LoadConfig(MapEnv({}));
    const std::vector<std::string> args = {"--idle-timeout-ms=0", "unlock", "--method=Biometric",
                                           "--privacy-mode=true", "--verbose", "1234"};
    auto rest = kt::ApplyOverrides(config, args);
    assert(config.idle_timeout == 0ms);
    assert(config.privacy_mode);
    assert((rest == std::vector<std::string>{"unlock", "--method=Biometric", "--verbose", "1234"}));

    bool rejected = false;
    try {
      (void)kt::ApplyOverrides(config, {"--pin-length=four"});
    } catch (const kt::Error& err) {
      rejected = err.code == kt::errors::config::kInvalidValue &&
                 std::string(err.what()).rfind("Invalid value for pin-length", 0) == 0;
    }
    assert(rejected);
    assert(config.pin_length == 4);
  }

  std::cout << "config tests ok\n";
  return 0;
}
