#include "kt/auth/lockout_policy.h"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "kt/error.h"
#include "kt/store/ipc_lock.h"

#if !defined(_WIN32)
#include <csignal>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace {

class TempDir {
public:
  TempDir() {
    path_ = std::filesystem::temp_directory_path() /
            ("kt_lockout_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

void FlipLastByte(const std::filesystem::path& path) {
  std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
  file.seekg(-1, std::ios::end);
  char byte = 0;
  file.read(&byte, 1);
  file.seekp(-1, std::ios::end);
  byte = static_cast<char>(byte ^ 0x5A);
  file.write(&byte, 1);
}

}  // namespace

int main() {
  using namespace std::chrono_literals;
  using kt::auth::LockoutOptions;
  using kt::auth::LockoutPolicy;

  LockoutOptions defaults;
  assert(defaults.max_backoff == 300s);
  assert(LockoutPolicy::BackoffFor(0, defaults) == 0s);
  assert(LockoutPolicy::BackoffFor(2, defaults) == 0s);
  assert(LockoutPolicy::BackoffFor(3, defaults) == 1s);
  assert(LockoutPolicy::BackoffFor(4, defaults) == 2s);
  assert(LockoutPolicy::BackoffFor(10, defaults) == 128s);
  assert(LockoutPolicy::BackoffFor(11, defaults) == 256s);
  assert(LockoutPolicy::BackoffFor(12, defaults) == 300s);
  assert(LockoutPolicy::BackoffFor(500, defaults) == 300s);

  {
    kt::ManualClock clock;
    kt::auth::InMemoryLockoutStore store;
    LockoutPolicy policy(store, clock);

    (void)policy.RecordFailure();
    (void)policy.RecordFailure();
    assert(!policy.IsLockedOut());
    policy.EnsureNotLockedOut();

    auto state = policy.RecordFailure();
    assert(state.failed_attempts == 3);
    assert(policy.IsLockedOut());
    assert(policy.RemainingLockout() == 1s);

    bool threw = false;
    try {
      policy.EnsureNotLockedOut();
    } catch (const kt::LockedOutError& err) {
      threw = true;
      assert(err.remaining_seconds == 1s);
      assert(std::string(err.what()) == "Too many failed attempts. Try again in 1 seconds.");
      assert(err.retryability == kt::Retryability::kTransient);
    }
    assert(threw);

    // Expiry unlocks but does not forgive.
    clock.Advance(1s);
    assert(!policy.IsLockedOut());
    state = policy.RecordFailure();
    assert(state.failed_attempts == 4);
    assert(policy.RemainingLockout() == 2s);

    // Backoff never decreases while failures accumulate.
    std::chrono::seconds previous = 2s;
    for (int i = 0; i < 12; ++i) {
      clock.Advance(previous);
      (void)policy.RecordFailure();
      const auto remaining = policy.RemainingLockout();
      assert(remaining >= previous);
      assert(remaining <= 300s);
      previous = remaining;
    }
    assert(previous == 300s);

    // Partial seconds round up.
    clock.Advance(299s + 500ms);
    assert(policy.RemainingLockout() == 1s);

    policy.RecordSuccess();
    assert(!policy.IsLockedOut());
    assert(policy.Snapshot().failed_attempts == 0);
    (void)policy.RecordFailure();
    assert(!policy.IsLockedOut());
  }

  {
    // A lockout in force is never shortened, whoever records the next failure.
    kt::ManualClock clock;
    kt::auth::InMemoryLockoutStore store;
    LockoutPolicy strict(store, clock);
    LockoutOptions lenient_options;
    lenient_options.max_backoff = 5s;
    LockoutPolicy lenient(store, clock, lenient_options);
    for (int i = 0; i < 12; ++i) {
      (void)strict.RecordFailure();
    }
    assert(strict.RemainingLockout() == 300s);
    (void)lenient.RecordFailure();
    assert(lenient.RemainingLockout() == 300s);
  }

  {
    TempDir dir;
    const auto path = dir.path() / "lockout.state";
    kt::ManualClock clock;
    kt::auth::FileLockoutStore first_store(path);
    kt::auth::FileLockoutStore second_store(path);
    LockoutPolicy first(first_store, clock);
    LockoutPolicy second(second_store, clock);

    // Failures recorded through one instance are visible through the other.
    (void)first.RecordFailure();
    (void)second.RecordFailure();
    (void)first.RecordFailure();
    assert(second.IsLockedOut());
    assert(second.Snapshot().failed_attempts == 3);
    assert(std::filesystem::exists(path));

    second.RecordSuccess();
    assert(!first.IsLockedOut());
    assert(first.Snapshot().failed_attempts == 0);
    assert(!std::filesystem::exists(path));

    // Tampering means maximal backoff, never a reset.
    (void)first.RecordFailure();
    FlipLastByte(path);
    assert(second.IsLockedOut());
    assert(second.RemainingLockout() == 300s);
    const auto normalized = first.Snapshot();
    assert(!normalized.tampered);
    assert(LockoutPolicy::BackoffFor(normalized.failed_attempts, first.options()) == 300s);

    // The rewritten record verifies again and keeps escalating from the maximum.
    clock.Advance(300s);
    assert(!first.IsLockedOut());
    (void)second.RecordFailure();
    assert(first.RemainingLockout() == 300s);

    // Truncation is tampering too.
    first.RecordSuccess();
    (void)first.RecordFailure();
    std::filesystem::resize_file(path, 4);
    assert(second.IsLockedOut());
  }

#if !defined(_WIN32)
  {
    // A process killed while holding the state gate must not stall the next failure.
    TempDir dir;
    const auto path = dir.path() / "lockout.state";
    int ready[2];
    const int piped = ::pipe(ready);
    assert(piped == 0);
    const pid_t child = ::fork();
    assert(child >= 0);
    if (child == 0) {
      ::close(ready[0]);
      auto gate = kt::store::ScopedIpcLock::RequireForPath(path);
      const char held = gate.locked() ? '1' : '0';
      if (::write(ready[1], &held, 1) != 1) {
        ::_exit(2);
      }
      ::raise(SIGKILL);
      ::_exit(1);
    }
    ::close(ready[1]);
    char held = 0;
    const auto got = ::read(ready[0], &held, 1);
    ::close(ready[0]);
    assert(got == 1 && held == '1');
    int status = 0;
    const pid_t reaped = ::waitpid(child, &status, 0);
    assert(reaped == child);
    assert(WIFSIGNALED(status));

    kt::ManualClock clock;
    kt::auth::FileLockoutStore store(path);
    LockoutPolicy policy(store, clock);
    const auto state = policy.RecordFailure();
    assert(state.failed_attempts == 1);
    assert(policy.Snapshot().failed_attempts == 1);
  }
#endif

  std::cout << "lockout policy tests ok\n";
  return 0;
}
