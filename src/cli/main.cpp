#include <array>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#if !defined(_WIN32)
#include <termios.h>
#include <unistd.h>
#endif

#include "kt/access/permission_matrix.h"
#include "kt/auth/credential_hasher.h"
#include "kt/auth/credential_store.h"
#include "kt/auth/lockout_policy.h"
#include "kt/config.h"
#include "kt/crypto/provider.h"
#include "kt/error.h"
#include "kt/errors.h"
#include "kt/logging/audit.h"
#include "kt/logging/event_bus.h"
#include "kt/privacy/privacy_redactor.h"
#include "kt/ratelimit/rate_limiter.h"
#include "kt/security/zeroizer.h"
#include "kt/session/session_guard.h"
#include "kt/session/timer_queue.h"

namespace {

  constexpr size_t kMaxPinInputLen = 64;

  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 64;
  constexpr int kExitIO = 74;
  constexpr int kExitTempFail = 75;
  constexpr int kExitAuth = 77;

  void PrintUsage() {
    std::cerr << "KinTrust\n";
    std::cerr << "Usage:\n";
    std::cerr << "  kt set-pin\n";
    std::cerr << "  kt change-pin\n";
    std::cerr << "  kt unlock [--method=NAME]\n";
    std::cerr << "  kt status\n";
    std::cerr << "  kt session                  Interactive idle-lock session on stdin\n";
    std::cerr << "  kt reset --confirm          Erase credential, lockout and rate-limit state\n";
    std::cerr << "  kt can <ROLE> <permission>\n";
    std::cerr << "  kt permissions <ROLE>\n";
    std::cerr << "  kt budget <key>             Spend one request from a rate-limit budget\n";
    std::cerr << "  kt redact [--name=NAME]... [text...]\n";
    std::cerr << "  kt audit-verify\n";
    std::cerr << "  kt token [bytes]\n";
    std::cerr << "\nGlobal flags (also KT_* environment variables):\n";
    std::cerr << "  --state-dir=PATH  --pin-length=N  --max-backoff-seconds=N\n";
    std::cerr << "  --auto-lock=0|1  --idle-timeout-ms=N  --onboarding-complete=0|1\n";
    std::cerr << "  --privacy-mode=0|1  --subject-name=NAME\n";
  }

#if !defined(_WIN32)
  class TermiosGuard {
  public:
    TermiosGuard(int fd, const termios& state) : fd_(fd), state_(state), restored_(false) {}
    ~TermiosGuard() {
      Restore();
    }
    void Restore() {
      if (!restored_) {
        tcsetattr(fd_, TCSAFLUSH, &state_);
        restored_ = true;
      }
    }

  private:
    int fd_;
    termios state_;
    bool restored_;
  };
#endif

  // Echo is disabled on a terminal; piped input is read one line at a time so
  // the tool can be scripted.
  std::string ReadPin(const std::string& prompt) {
#if !defined(_WIN32)
    if (isatty(STDIN_FILENO)) {
      termios original{};
      if (tcgetattr(STDIN_FILENO, &original) != 0) {
        const int err = errno;
        throw kt::Error{kt::ErrorDomain::IO, kt::errors::io::kConsoleModeQueryFailed,
                        "Failed to query terminal attributes.", err};
      }
      TermiosGuard guard(STDIN_FILENO, original);
      termios silent = original;
      silent.c_lflag &= ~ECHO;
      if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) != 0) {
        const int err = errno;
        throw kt::Error{kt::ErrorDomain::IO, kt::errors::io::kConsoleEchoDisableFailed,
                        "Failed to disable terminal echo.", err};
      }
      std::cout << prompt << std::flush;

      std::array<char, kMaxPinInputLen + 1> buffer{};
      kt::security::Zeroizer::ScopeWiper<char> buf_guard(buffer.data(), buffer.size());
      size_t pos = 0;
      bool overflow = false;
      while (true) {
        char ch = 0;
        ssize_t n = ::read(STDIN_FILENO, &ch, 1);
        if (n < 0) {
          if (errno == EINTR) {
            continue;
          }
          const int err = errno;
          throw kt::Error{kt::ErrorDomain::IO, kt::errors::io::kPinReadFailed,
                          "Failed to read PIN input.", err};
        }
        if (n == 0 || ch == '\n') {
          break;
        }
        if (ch == '\r') {
          continue;
        }
        if (pos >= kMaxPinInputLen) {
          overflow = true;
          continue;
        }
        buffer[pos++] = ch;
      }
      guard.Restore();
      std::cout << std::endl;
      if (overflow) {
        throw kt::ValidationError(std::string(kt::errors::msg::kPinWrongLength));
      }
      return std::string(buffer.data(), pos);
    }
#endif
    std::cout << prompt << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
      throw kt::Error{kt::ErrorDomain::IO, kt::errors::io::kPinReadFailed, "No PIN on standard input."};
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    return line;
  }

  std::string_view DomainPrefix(kt::ErrorDomain domain) {
    switch (domain) {
    case kt::ErrorDomain::IO:
      return "I/O error";
    case kt::ErrorDomain::Security:
      return "Security error";
    case kt::ErrorDomain::Crypto:
      return "Cryptography error";
    case kt::ErrorDomain::Validation:
      return "Validation error";
    case kt::ErrorDomain::Config:
      return "Configuration error";
    case kt::ErrorDomain::State:
      return "State error";
    case kt::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  void ReportError(const kt::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';

    kt::logging::Event event;
    event.category = kt::logging::EventCategory::kDiagnostics;
    event.severity = kt::logging::EventSeverity::kError;
    event.event_id = "cli_error";
    event.message = err.what();
    event.fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
    event.fields.emplace_back("code", std::to_string(err.code), kt::logging::FieldPrivacy::kPublic,
                              true);
    if (err.native_code.has_value()) {
      event.fields.emplace_back("native_code", std::to_string(*err.native_code),
                                kt::logging::FieldPrivacy::kHash, true);
    }
    try {
      kt::logging::EventBus::Instance().Publish(event);
    } catch (const std::exception& publish_error) {
      std::clog << "[cli] error report publish failed: " << publish_error.what() << std::endl;
    }
  }

  int ExitCodeFor(const kt::Error& err) {
    switch (err.domain) {
    case kt::ErrorDomain::IO:
      return kExitIO;
    case kt::ErrorDomain::Security:
    case kt::ErrorDomain::Crypto:
      return kExitAuth;
    case kt::ErrorDomain::Validation:
    case kt::ErrorDomain::Config:
      return kExitUsage;
    case kt::ErrorDomain::State:
    case kt::ErrorDomain::Internal:
    default:
      return kExitIO;
    }
  }

  // Everything a command needs, wired to the files under the state directory.
  // The audit sink is subscribed to the process-wide bus and kept alive by it.
  struct Runtime {
    explicit Runtime(const kt::Config& cfg)
        : config(cfg),
          credential_backend(cfg.CredentialPath()),
          credentials(credential_backend, hasher, cfg.pin_length),
          lockout_store(cfg.LockoutPath()),
          lockout(lockout_store, kt::DefaultClock(), cfg.Lockout()),
          rate_store(cfg.RateLimitDir()),
          budgets(rate_store, kt::DefaultClock()),
          audit(kt::logging::EventBus::Instance(), kt::DefaultClock()) {}

    kt::Config config;
    kt::auth::CredentialHasher hasher;
    kt::auth::FileCredentialBackend credential_backend;
    kt::auth::CredentialStore credentials;
    kt::auth::FileLockoutStore lockout_store;
    kt::auth::LockoutPolicy lockout;
    kt::ratelimit::FileRateLimitStore rate_store;
    kt::ratelimit::RateLimiterRegistry budgets;
    kt::logging::AuditLog audit;
  };

  void AttachAuditSink(const kt::Config& config) {
    auto logger = std::make_shared<kt::logging::JsonLineLogger>(config.AuditLogPath());
    if (!logger->healthy()) {
      std::clog << "[audit] existing log failed verification; new entries are not appended"
                << std::endl;
    }
    kt::logging::EventBus::Instance().Subscribe(
        [logger](const kt::logging::Event& event) { logger->Log(event); });
  }

  int HandleSetPin(Runtime& rt) {
    if (rt.credentials.HasCredential()) {
      throw kt::ValidationError(std::string(kt::errors::msg::kCredentialAlreadyEnrolled),
                                kt::errors::validation::kCredentialExists);
    }
    auto pin = ReadPin("New PIN: ");
    kt::security::Zeroizer::ScopeWiper<char> pin_guard(pin.data(), pin.size());
    auto confirmation = ReadPin("Confirm PIN: ");
    kt::security::Zeroizer::ScopeWiper<char> confirm_guard(confirmation.data(), confirmation.size());
    rt.credentials.SetPin(pin, confirmation);
    rt.audit.Record(kt::logging::AuditEventType::kSystemInit, kt::logging::AuditSeverity::kInfo,
                    std::string(kt::errors::msg::kPinEnrolled));
    std::cout << "PIN set." << std::endl;
    return kExitOk;
  }

  int HandleChangePin(Runtime& rt) {
    kt::session::TimerQueue timers(kt::DefaultClock());
    kt::session::SessionGuard guard(rt.credentials, rt.lockout, timers, rt.audit, rt.config.Session());
    auto current = ReadPin("Current PIN: ");
    kt::security::Zeroizer::ScopeWiper<char> current_guard(current.data(), current.size());
    auto next = ReadPin("New PIN: ");
    kt::security::Zeroizer::ScopeWiper<char> next_guard(next.data(), next.size());
    auto confirmation = ReadPin("Confirm PIN: ");
    kt::security::Zeroizer::ScopeWiper<char> confirm_guard(confirmation.data(), confirmation.size());
    guard.ChangePin(current, next, confirmation);
    std::cout << "PIN changed." << std::endl;
    return kExitOk;
  }

  int HandleUnlock(Runtime& rt, std::string_view method) {
    kt::session::TimerQueue timers(kt::DefaultClock());
    kt::session::SessionGuard guard(rt.credentials, rt.lockout, timers, rt.audit, rt.config.Session());
    guard.Lock();
    auto pin = ReadPin("PIN: ");
    kt::security::Zeroizer::ScopeWiper<char> pin_guard(pin.data(), pin.size());
    guard.Unlock(pin, method);
    std::cout << "Unlocked." << std::endl;
    return kExitOk;
  }

  int HandleStatus(Runtime& rt) {
    auto credential = rt.credentials.Current();
    std::cout << "state dir:        " << rt.config.state_dir.string() << '\n';
    if (!credential) {
      std::cout << "pin:              not set\n";
    } else {
      std::cout << "pin:              set ("
                << (credential->IsSecure() ? "salted PBKDF2-SHA256" : "legacy, upgrades on next unlock")
                << ")\n";
    }
    const auto snapshot = rt.lockout.Snapshot();
    const auto remaining = rt.lockout.RemainingLockout();
    std::cout << "failed attempts:  " << snapshot.failed_attempts << '\n';
    if (remaining.count() > 0) {
      std::cout << "locked out:       " << remaining.count() << "s remaining\n";
    } else {
      std::cout << "locked out:       no\n";
    }
    std::cout << "auto-lock:        "
              << (rt.config.auto_lock_enabled ? "on after " + std::to_string(rt.config.idle_timeout.count()) + "ms"
                                              : std::string("off"))
              << '\n';
    for (auto key : {kt::ratelimit::kAiGeneralBudget, kt::ratelimit::kChatBudget,
                     kt::ratelimit::kReceiptScanBudget}) {
      const auto& budget = rt.budgets.BudgetFor(key);
      std::cout << "budget " << key << ": " << rt.budgets.RemainingRequests(key) << '/'
                << budget.max_requests << " left";
      const auto reset = rt.budgets.ResetTime(key);
      if (reset.count() > 0) {
        std::cout << ", resets in " << reset.count() << "ms";
      }
      std::cout << '\n';
    }
    std::cout << std::flush;
    return kExitOk;
  }

  std::optional<kt::session::ActivityKind> ParseActivity(std::string_view name) {
    if (name.empty() || name == "pointer") {
      return kt::session::ActivityKind::kPointer;
    }
    if (name == "keyboard") {
      return kt::session::ActivityKind::kKeyboard;
    }
    if (name == "scroll") {
      return kt::session::ActivityKind::kScroll;
    }
    return std::nullopt;
  }

  // Line-driven session: due timers fire before each command is handled, so
  // leaving the prompt idle past the timeout locks the session.
  int HandleSession(Runtime& rt) {
    kt::session::TimerQueue timers(kt::DefaultClock());
    kt::session::SessionGuard guard(rt.credentials, rt.lockout, timers, rt.audit, rt.config.Session());
    guard.on_state_change = [](kt::session::SessionState state) {
      std::cout << "[session] " << kt::session::ToString(state) << std::endl;
    };
    std::cout << "commands: activity [pointer|keyboard|scroll], unlock <pin>, lock, status, quit"
              << std::endl;
    std::string line;
    while (std::getline(std::cin, line)) {
      timers.RunDue();
      std::istringstream words(line);
      std::string command;
      std::string argument;
      words >> command >> argument;
      kt::security::Zeroizer::ScopeWiper<char> line_guard(line.data(), line.size());
      kt::security::Zeroizer::ScopeWiper<char> arg_guard(argument.data(), argument.size());
      if (command.empty()) {
        continue;
      }
      if (command == "quit" || command == "exit") {
        break;
      }
      try {
        if (command == "activity") {
          auto kind = ParseActivity(argument);
          if (!kind) {
            std::cerr << "Validation error: unknown activity kind" << std::endl;
            continue;
          }
          guard.NotifyActivity(*kind);
        } else if (command == "unlock") {
          guard.Unlock(argument);
        } else if (command == "lock") {
          guard.Lock();
        } else if (command == "status") {
          std::cout << kt::session::ToString(guard.State())
                    << (guard.TimerArmed() ? " (idle timer armed)" : "") << std::endl;
        } else {
          std::cerr << "unknown command: " << command << std::endl;
        }
      } catch (const kt::Error& err) {
        std::cerr << DomainPrefix(err.domain) << ": " << err.what() << std::endl;
      }
    }
    guard.Stop();
    return kExitOk;
  }

  int HandleReset(Runtime& rt) {
    rt.credentials.Clear();
    rt.lockout.RecordSuccess();
    for (auto key : {kt::ratelimit::kAiGeneralBudget, kt::ratelimit::kChatBudget,
                     kt::ratelimit::kReceiptScanBudget}) {
      rt.budgets.Reset(key);
    }
    rt.audit.Record(kt::logging::AuditEventType::kDataReset, kt::logging::AuditSeverity::kCritical,
                    std::string(kt::errors::msg::kDataReset));
    std::cout << "Local security state erased." << std::endl;
    return kExitOk;
  }

  int HandleCan(std::string_view role_name, std::string_view permission_name) {
    kt::access::Principal principal{"cli", kt::access::RequireKnownRole(role_name)};
    const auto permission = kt::access::RequireKnownPermission(permission_name);
    kt::access::PermissionMatrix::RequirePermission(principal, permission);
    std::cout << "allowed" << std::endl;
    return kExitOk;
  }

  int HandlePermissions(std::string_view role_name) {
    const auto role = kt::access::RequireKnownRole(role_name);
    for (auto permission : kt::access::PermissionMatrix::PermissionsFor(role)) {
      std::cout << kt::access::ToString(permission) << '\n';
    }
    std::cout << std::flush;
    return kExitOk;
  }

  int HandleBudget(Runtime& rt, std::string_view key) {
    rt.budgets.Acquire(key);
    std::cout << "allowed; " << rt.budgets.RemainingRequests(key) << " left in this window" << std::endl;
    return kExitOk;
  }

  int HandleRedact(const kt::Config& config, const std::vector<std::string>& args) {
    auto redaction = config.Redaction();
    // Asking for redaction explicitly implies it, whatever the ambient setting.
    redaction.privacy_mode = true;
    std::vector<std::string> words;
    for (const auto& arg : args) {
      if (arg.rfind("--name=", 0) == 0) {
        redaction.extra_names.push_back(arg.substr(std::string_view("--name=").size()));
      } else {
        words.push_back(arg);
      }
    }
    kt::privacy::PrivacyRedactor redactor(redaction);
    if (!words.empty()) {
      std::string text;
      for (size_t i = 0; i < words.size(); ++i) {
        if (i != 0) {
          text.push_back(' ');
        }
        text += words[i];
      }
      std::cout << redactor.Redact(text) << std::endl;
      return kExitOk;
    }
    std::string line;
    while (std::getline(std::cin, line)) {
      std::cout << redactor.Redact(line) << '\n';
    }
    std::cout << std::flush;
    return kExitOk;
  }

  int HandleAuditVerify(const kt::Config& config) {
    const auto path = config.AuditLogPath();
    if (!std::filesystem::exists(path)) {
      std::cout << "No audit log at " << path.string() << std::endl;
      return kExitOk;
    }
    kt::logging::JsonLineLogger logger(path);
    if (!logger.Verify()) {
      std::cerr << "Security error: audit log chain does not verify" << std::endl;
      return kExitAuth;
    }
    std::cout << "audit log OK (" << logger.entries() << " entries)" << std::endl;
    return kExitOk;
  }

  int HandleToken(std::optional<std::string_view> size_arg) {
    size_t bytes = 32;
    if (size_arg) {
      auto result = std::from_chars(size_arg->data(), size_arg->data() + size_arg->size(), bytes);
      if (result.ec != std::errc{} || result.ptr != size_arg->data() + size_arg->size() || bytes == 0 ||
          bytes > 1024) {
        std::cerr << "Validation error: token size must be between 1 and 1024 bytes." << std::endl;
        return kExitUsage;
      }
    }
    std::cout << kt::auth::CredentialHasher::GenerateSecureToken(bytes) << std::endl;
    return kExitOk;
  }

} // namespace

int main(int argc, char** argv) {
  try {
    std::vector<std::string> raw;
    for (int i = 1; i < argc; ++i) {
      raw.emplace_back(argv[i]);
    }
    auto config = kt::LoadConfigFromEnvironment();
    auto args = kt::ApplyOverrides(config, raw);
    if (args.empty()) {
      PrintUsage();
      return kExitUsage;
    }
    const std::string cmd = args.front();
    args.erase(args.begin());

    // Commands that touch no local state.
    if (cmd == "can") {
      if (args.size() != 2) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleCan(args[0], args[1]);
    }
    if (cmd == "permissions") {
      if (args.size() != 1) {
        PrintUsage();
        return kExitUsage;
      }
      return HandlePermissions(args[0]);
    }
    if (cmd == "redact") {
      return HandleRedact(config, args);
    }
    if (cmd == "audit-verify") {
      return HandleAuditVerify(config);
    }
    if (cmd == "token") {
      if (args.size() > 1) {
        PrintUsage();
        return kExitUsage;
      }
      kt::crypto::EnsureCryptoProviderInitialized();
      return HandleToken(args.empty() ? std::nullopt : std::optional<std::string_view>(args[0]));
    }

    kt::crypto::EnsureCryptoProviderInitialized();
    AttachAuditSink(config);
    Runtime rt(config);

    if (cmd == "set-pin" && args.empty()) {
      return HandleSetPin(rt);
    }
    if (cmd == "change-pin" && args.empty()) {
      return HandleChangePin(rt);
    }
    if (cmd == "unlock") {
      std::string method = "PIN";
      for (const auto& arg : args) {
        if (arg.rfind("--method=", 0) == 0 && arg.size() > std::string_view("--method=").size()) {
          method = arg.substr(std::string_view("--method=").size());
        } else {
          PrintUsage();
          return kExitUsage;
        }
      }
      return HandleUnlock(rt, method);
    }
    if (cmd == "status" && args.empty()) {
      return HandleStatus(rt);
    }
    if (cmd == "session" && args.empty()) {
      return HandleSession(rt);
    }
    if (cmd == "reset") {
      if (args.size() != 1 || args[0] != "--confirm") {
        std::cerr << "Validation error: reset requires --confirm." << std::endl;
        return kExitUsage;
      }
      return HandleReset(rt);
    }
    if (cmd == "budget" && args.size() == 1) {
      return HandleBudget(rt, args[0]);
    }

    PrintUsage();
    return kExitUsage;
  } catch (const kt::LockedOutError& err) {
    ReportError(err);
    return kExitTempFail;
  } catch (const kt::RateLimitedError& err) {
    ReportError(err);
    return kExitTempFail;
  } catch (const kt::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "I/O error: " << err.what() << std::endl;
    return kExitIO;
  }
}
