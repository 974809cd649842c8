#include "kt/ratelimit/rate_limiter.h"

#include <algorithm>
#include <iostream>

#include "kt/common.h"
#include "kt/crypto/sha256.h"
#include "kt/error.h"
#include "kt/errors.h"
#include "kt/store/io_util.h"
#include "kt/store/ipc_lock.h"
#include "kt/store/state_file.h"

namespace kt::ratelimit {
namespace {

constexpr uint32_t kWindowFileVersion = 1;
constexpr std::string_view kWindowFilePurpose{"kintrust.ratelimit:"};

#pragma pack(push, 1)
struct WindowFileRecord {
  uint32_t version_le{0};
  uint32_t count_le{0};
  uint64_t window_start_ms_le{0};
};
#pragma pack(pop)

static_assert(sizeof(WindowFileRecord) == 16, "rate window record layout mismatch");

std::string PurposeFor(const std::string& key) {
  return std::string(kWindowFilePurpose) + key;
}

int64_t ToEpochMillis(Clock::TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Clock::TimePoint FromEpochMillis(int64_t ms) {
  return Clock::TimePoint(
      std::chrono::duration_cast<Clock::Duration>(std::chrono::milliseconds(ms)));
}

}  // namespace

std::optional<RateWindow> InMemoryRateLimitStore::Update(const std::string& key,
                                                         const Mutator& mutate) {
  std::lock_guard<std::mutex> guard(mutex_);
  std::optional<RateWindow> current;
  if (auto it = windows_.find(key); it != windows_.end()) {
    current = it->second;
  }
  auto next = mutate(current);
  if (next) {
    next->tampered = false;
    windows_[key] = *next;
  } else {
    windows_.erase(key);
  }
  return next;
}

std::optional<RateWindow> InMemoryRateLimitStore::Peek(const std::string& key) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (auto it = windows_.find(key); it != windows_.end()) {
    return it->second;
  }
  return std::nullopt;
}

void InMemoryRateLimitStore::Erase(const std::string& key) {
  std::lock_guard<std::mutex> guard(mutex_);
  windows_.erase(key);
}

std::filesystem::path FileRateLimitStore::PathForKey(const std::string& key) const {
  // Keys are opaque; the digest keeps arbitrary bytes out of file names.
  const auto digest = kt::crypto::SHA256_Hash(std::string_view(key));
  const auto prefix = std::span<const uint8_t>(digest.data(), 8);
  return directory_ / ("ratelimit-" + kt::HexEncode(prefix) + ".state");
}

std::optional<RateWindow> FileRateLimitStore::ReadLocked(const std::filesystem::path& path,
                                                         const std::string& key) const {
  auto sealed = kt::store::ReadSealedFile(path, PurposeFor(key), sizeof(WindowFileRecord));
  switch (sealed.status) {
    case kt::store::SealedReadStatus::kMissing:
      return std::nullopt;
    case kt::store::SealedReadStatus::kTampered: {
      RateWindow window;
      window.tampered = true;
      return window;
    }
    case kt::store::SealedReadStatus::kValid:
      break;
  }
  WindowFileRecord record{};
  std::copy(sealed.body.begin(), sealed.body.end(), reinterpret_cast<uint8_t*>(&record));
  RateWindow window;
  if (kt::FromLittleEndian32(record.version_le) != kWindowFileVersion) {
    window.tampered = true;
    return window;
  }
  window.count = kt::FromLittleEndian32(record.count_le);
  window.window_start =
      FromEpochMillis(static_cast<int64_t>(kt::FromLittleEndian64(record.window_start_ms_le)));
  return window;
}

void FileRateLimitStore::WriteLocked(const std::filesystem::path& path, const std::string& key,
                                     const std::optional<RateWindow>& window) const {
  if (!window) {
    kt::store::RemoveFileIfExists(path);
    return;
  }
  WindowFileRecord record{};
  record.version_le = kt::ToLittleEndian(kWindowFileVersion);
  record.count_le = kt::ToLittleEndian(window->count);
  record.window_start_ms_le =
      kt::ToLittleEndian64(static_cast<uint64_t>(ToEpochMillis(window->window_start)));
  kt::store::WriteSealedFile(path, PurposeFor(key), kt::AsBytesConst(record));
}

std::optional<RateWindow> FileRateLimitStore::Update(const std::string& key,
                                                     const Mutator& mutate) {
  const auto path = PathForKey(key);
  auto gate = kt::store::ScopedIpcLock::RequireForPath(path);
  const auto loaded = ReadLocked(path, key);
  auto next = mutate(loaded);
  if (next) {
    next->tampered = false;
  }
  const bool changed =
      loaded.has_value() != next.has_value() ||
      (loaded && (loaded->tampered || loaded->count != next->count ||
                  loaded->window_start != next->window_start));
  if (changed) {
    WriteLocked(path, key, next);
  }
  return next;
}

std::optional<RateWindow> FileRateLimitStore::Peek(const std::string& key) {
  const auto path = PathForKey(key);
  auto gate = kt::store::ScopedIpcLock::RequireForPath(path);
  return ReadLocked(path, key);
}

void FileRateLimitStore::Erase(const std::string& key) {
  const auto path = PathForKey(key);
  auto gate = kt::store::ScopedIpcLock::RequireForPath(path);
  kt::store::RemoveFileIfExists(path);
}

RateLimiterRegistry::RateLimiterRegistry(RateLimitStore& store, const Clock& clock)
    : store_(store), clock_(clock) {
  using std::chrono::minutes;
  Register(std::string(kAiGeneralBudget), Budget{30, minutes(1)});
  Register(std::string(kChatBudget), Budget{10, minutes(1)});
  Register(std::string(kReceiptScanBudget), Budget{5, minutes(1)});
}

void RateLimiterRegistry::Register(std::string key, Budget budget) {
  if (key.empty() || budget.max_requests == 0 || budget.window <= std::chrono::milliseconds::zero()) {
    throw kt::Error{kt::ErrorDomain::Config, kt::errors::config::kInvalidValue,
                    "Rate limit budget must name a key and allow at least one request per window",
                    std::nullopt, kt::Retryability::kFatal, {key}};
  }
  budgets_[std::move(key)] = budget;
}

bool RateLimiterRegistry::HasBudget(std::string_view key) const {
  return budgets_.find(key) != budgets_.end();
}

const Budget& RateLimiterRegistry::BudgetFor(std::string_view key) const {
  return Require(key);
}

const Budget& RateLimiterRegistry::Require(std::string_view key) const {
  auto it = budgets_.find(key);
  if (it == budgets_.end()) {
    throw kt::Error{kt::ErrorDomain::Config, kt::errors::config::kUnknownBudget,
                    std::string(kt::errors::msg::kUnknownRateBudget) + ": " + std::string(key)};
  }
  return it->second;
}

bool RateLimiterRegistry::Expired(const RateWindow& window, const Budget& budget,
                                  Clock::TimePoint now) const {
  return now - window.window_start >= budget.window;
}

bool RateLimiterRegistry::IsAllowed(std::string_view key) {
  const auto& budget = Require(key);
  const auto now = clock_.Now();
  bool allowed = false;
  store_.Update(std::string(key), [&](std::optional<RateWindow> window) -> std::optional<RateWindow> {
    if (window && window->tampered) {
      std::clog << "[ratelimit] window for '" << key
                << "' failed its integrity check; treating budget as spent" << std::endl;
      return RateWindow{budget.max_requests, now, false};
    }
    if (!window || Expired(*window, budget, now)) {
      window = RateWindow{0, now, false};
    }
    if (window->count < budget.max_requests) {
      ++window->count;
      allowed = true;
    }
    return window;
  });
  return allowed;
}

void RateLimiterRegistry::Acquire(std::string_view key) {
  if (IsAllowed(key)) {
    return;
  }
  const auto reset = ResetTime(key);
  const auto seconds = std::chrono::ceil<std::chrono::seconds>(reset);
  throw kt::RateLimitedError(std::string(kt::errors::msg::kRateLimitExceeded) +
                                 std::to_string(seconds.count()) + " seconds.",
                             std::string(key), reset);
}

std::chrono::milliseconds RateLimiterRegistry::ResetTime(std::string_view key) {
  const auto& budget = Require(key);
  const auto window = store_.Peek(std::string(key));
  if (!window || window->tampered) {
    return window ? budget.window : std::chrono::milliseconds::zero();
  }
  const auto now = clock_.Now();
  if (Expired(*window, budget, now)) {
    return std::chrono::milliseconds::zero();
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - window->window_start);
  return budget.window - std::max(elapsed, std::chrono::milliseconds::zero());
}

uint32_t RateLimiterRegistry::RemainingRequests(std::string_view key) {
  const auto& budget = Require(key);
  const auto window = store_.Peek(std::string(key));
  if (!window) {
    return budget.max_requests;
  }
  if (window->tampered) {
    return 0;
  }
  if (Expired(*window, budget, clock_.Now())) {
    return budget.max_requests;
  }
  return budget.max_requests - std::min(window->count, budget.max_requests);
}

void RateLimiterRegistry::Reset(std::string_view key) {
  (void)Require(key);
  store_.Erase(std::string(key));
}

}  // namespace kt::ratelimit
