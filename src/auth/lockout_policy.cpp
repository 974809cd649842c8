#include "kt/auth/lockout_policy.h"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "kt/common.h"
#include "kt/error.h"
#include "kt/errors.h"
#include "kt/store/io_util.h"
#include "kt/store/ipc_lock.h"
#include "kt/store/state_file.h"

namespace kt::auth {
namespace {

constexpr uint32_t kLockFileVersion = 1;
constexpr std::string_view kLockFilePurpose{"kintrust.lockout"};

#pragma pack(push, 1)
struct LockFileRecord {
  uint32_t version_le{0};
  uint32_t failures_le{0};
  uint64_t lockout_until_ms_le{0};  // 0 = no lockout recorded
};
#pragma pack(pop)

static_assert(sizeof(LockFileRecord) == 16, "lock file record layout mismatch");

bool SameState(const LockoutState& a, const LockoutState& b) {
  return a.failed_attempts == b.failed_attempts && a.lockout_until == b.lockout_until &&
         a.tampered == b.tampered;
}

uint64_t ToEpochMillis(Clock::TimePoint tp) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  return ms <= 0 ? 1 : static_cast<uint64_t>(ms);
}

Clock::TimePoint FromEpochMillis(uint64_t ms) {
  return Clock::TimePoint(std::chrono::duration_cast<Clock::Duration>(
      std::chrono::milliseconds(static_cast<int64_t>(ms))));
}

}  // namespace

LockoutState InMemoryLockoutStore::Update(const Mutator& mutate) {
  std::lock_guard<std::mutex> guard(mutex_);
  state_ = mutate(state_);
  state_.tampered = false;
  return state_;
}

void InMemoryLockoutStore::Clear() {
  std::lock_guard<std::mutex> guard(mutex_);
  state_ = LockoutState{};
}

LockoutState FileLockoutStore::ReadLocked() const {
  auto sealed = kt::store::ReadSealedFile(path_, kLockFilePurpose, sizeof(LockFileRecord));
  LockoutState state;
  switch (sealed.status) {
    case kt::store::SealedReadStatus::kMissing:
      return state;
    case kt::store::SealedReadStatus::kTampered:
      state.tampered = true;
      return state;
    case kt::store::SealedReadStatus::kValid:
      break;
  }
  LockFileRecord record{};
  std::copy(sealed.body.begin(), sealed.body.end(), reinterpret_cast<uint8_t*>(&record));
  if (kt::FromLittleEndian32(record.version_le) != kLockFileVersion) {
    state.tampered = true;
    return state;
  }
  state.failed_attempts = kt::FromLittleEndian32(record.failures_le);
  const uint64_t until_ms = kt::FromLittleEndian64(record.lockout_until_ms_le);
  if (until_ms != 0) {
    state.lockout_until = FromEpochMillis(until_ms);
  }
  return state;
}

void FileLockoutStore::WriteLocked(const LockoutState& state) const {
  if (state.failed_attempts == 0 && !state.lockout_until) {
    kt::store::RemoveFileIfExists(path_);
    return;
  }
  LockFileRecord record{};
  record.version_le = kt::ToLittleEndian(kLockFileVersion);
  record.failures_le = kt::ToLittleEndian(state.failed_attempts);
  record.lockout_until_ms_le =
      kt::ToLittleEndian64(state.lockout_until ? ToEpochMillis(*state.lockout_until) : 0);
  kt::store::WriteSealedFile(path_, kLockFilePurpose, kt::AsBytesConst(record));
}

LockoutState FileLockoutStore::Update(const Mutator& mutate) {
  auto gate = kt::store::ScopedIpcLock::RequireForPath(path_);
  const auto loaded = ReadLocked();
  auto next = mutate(loaded);
  next.tampered = false;
  if (loaded.tampered || !SameState(loaded, next)) {
    WriteLocked(next);
  }
  return next;
}

void FileLockoutStore::Clear() {
  auto gate = kt::store::ScopedIpcLock::RequireForPath(path_);
  kt::store::RemoveFileIfExists(path_);
}

LockoutPolicy::LockoutPolicy(LockoutStore& store, const Clock& clock, LockoutOptions options)
    : store_(store), clock_(clock), options_(options) {}

std::chrono::seconds LockoutPolicy::BackoffFor(uint32_t attempts, const LockoutOptions& options) {
  if (attempts < options.threshold) {
    return std::chrono::seconds::zero();
  }
  const uint32_t exponent = attempts - options.threshold;
  if (exponent >= 62) {
    return options.max_backoff;
  }
  const auto backoff = std::chrono::seconds(int64_t{1} << exponent);
  return std::min(options.max_backoff, backoff);
}

LockoutState LockoutPolicy::Normalize(LockoutState state, Clock::TimePoint now) const {
  if (!state.tampered) {
    return state;
  }
  std::clog << "[lockout] persisted state failed its integrity check; enforcing maximal backoff"
            << std::endl;
  uint32_t attempts = std::max(state.failed_attempts, options_.threshold);
  while (BackoffFor(attempts, options_) < options_.max_backoff) {
    ++attempts;
  }
  state.failed_attempts = attempts;
  state.lockout_until = now + options_.max_backoff;
  state.tampered = false;
  return state;
}

LockoutState LockoutPolicy::RecordFailure() {
  const auto now = clock_.Now();
  return store_.Update([&](LockoutState state) {
    state = Normalize(std::move(state), now);
    if (state.failed_attempts < UINT32_MAX) {
      ++state.failed_attempts;
    }
    if (state.failed_attempts >= options_.threshold) {
      const auto candidate = now + BackoffFor(state.failed_attempts, options_);
      // Never shorten a lockout already in force.
      if (!state.lockout_until || *state.lockout_until < candidate) {
        state.lockout_until = candidate;
      }
    }
    return state;
  });
}

void LockoutPolicy::RecordSuccess() {
  store_.Clear();
}

LockoutState LockoutPolicy::Snapshot() {
  const auto now = clock_.Now();
  return store_.Update([&](LockoutState state) { return Normalize(std::move(state), now); });
}

bool LockoutPolicy::IsLockedOut(Clock::TimePoint now) {
  const auto state = store_.Update([&](LockoutState s) { return Normalize(std::move(s), now); });
  return state.lockout_until.has_value() && now < *state.lockout_until;
}

bool LockoutPolicy::IsLockedOut() {
  return IsLockedOut(clock_.Now());
}

std::chrono::seconds LockoutPolicy::RemainingLockout(Clock::TimePoint now) {
  const auto state = store_.Update([&](LockoutState s) { return Normalize(std::move(s), now); });
  if (!state.lockout_until || now >= *state.lockout_until) {
    return std::chrono::seconds::zero();
  }
  return std::chrono::ceil<std::chrono::seconds>(*state.lockout_until - now);
}

std::chrono::seconds LockoutPolicy::RemainingLockout() {
  return RemainingLockout(clock_.Now());
}

void LockoutPolicy::EnsureNotLockedOut() {
  const auto remaining = RemainingLockout(clock_.Now());
  if (remaining > std::chrono::seconds::zero()) {
    throw kt::LockedOutError(std::string(kt::errors::msg::kLockedOut) +
                                 std::to_string(remaining.count()) + " seconds.",
                             remaining);
  }
}

}  // namespace kt::auth
