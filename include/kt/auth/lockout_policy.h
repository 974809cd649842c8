#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>

#include "kt/clock.h"

namespace kt::auth {

struct LockoutState {
  uint32_t failed_attempts{0};
  std::optional<Clock::TimePoint> lockout_until;
  bool tampered{false};  // persisted copy failed its integrity check
};

// Storage seam for lockout state. Update() is an atomic read-modify-write; the
// file store makes it atomic across processes as well.
class LockoutStore {
 public:
  using Mutator = std::function<LockoutState(LockoutState)>;

  virtual ~LockoutStore() = default;
  virtual LockoutState Update(const Mutator& mutate) = 0;
  virtual void Clear() = 0;
};

class InMemoryLockoutStore final : public LockoutStore {
 public:
  LockoutState Update(const Mutator& mutate) override;
  void Clear() override;

 private:
  std::mutex mutex_;
  LockoutState state_{};
};

// HMAC-sealed record guarded by a named cross-process lock. A record that
// fails verification loads as tampered, which the policy turns into the
// maximal backoff rather than a reset.
class FileLockoutStore final : public LockoutStore {
 public:
  explicit FileLockoutStore(std::filesystem::path path) : path_(std::move(path)) {}

  LockoutState Update(const Mutator& mutate) override;
  void Clear() override;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

 private:
  LockoutState ReadLocked() const;
  void WriteLocked(const LockoutState& state) const;

  std::filesystem::path path_;
};

struct LockoutOptions {
  std::chrono::seconds max_backoff{300};
  uint32_t threshold{3};
};

// Failed-attempt counter with exponential backoff. Only RecordSuccess() clears
// the counter; an expired lockout does not forgive earlier failures.
class LockoutPolicy {
 public:
  explicit LockoutPolicy(LockoutStore& store, const Clock& clock = DefaultClock(),
                         LockoutOptions options = {});

  LockoutState RecordFailure();
  void RecordSuccess();

  [[nodiscard]] bool IsLockedOut();
  [[nodiscard]] bool IsLockedOut(Clock::TimePoint now);

  // Whole seconds, rounded up; zero when not locked out.
  [[nodiscard]] std::chrono::seconds RemainingLockout();
  [[nodiscard]] std::chrono::seconds RemainingLockout(Clock::TimePoint now);

  // Throws kt::LockedOutError while a lockout is in force.
  void EnsureNotLockedOut();

  [[nodiscard]] LockoutState Snapshot();

  [[nodiscard]] const LockoutOptions& options() const noexcept { return options_; }

  // min(max_backoff, 2^(attempts - threshold)) once attempts >= threshold.
  [[nodiscard]] static std::chrono::seconds BackoffFor(uint32_t attempts,
                                                       const LockoutOptions& options);

 private:
  LockoutState Normalize(LockoutState state, Clock::TimePoint now) const;

  LockoutStore& store_;
  const Clock& clock_;
  LockoutOptions options_;
};

}  // namespace kt::auth
