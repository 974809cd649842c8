#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "kt/clock.h"

namespace kt::ratelimit {

struct Budget {
  uint32_t max_requests{0};
  std::chrono::milliseconds window{0};
};

struct RateWindow {
  uint32_t count{0};
  Clock::TimePoint window_start{};
  bool tampered{false};  // persisted copy failed its integrity check
};

inline constexpr std::string_view kAiGeneralBudget{"ai-general"};
inline constexpr std::string_view kChatBudget{"chat"};
inline constexpr std::string_view kReceiptScanBudget{"receipt-scan"};

// Storage seam for per-key windows. Update() is an atomic read-modify-write;
// returning std::nullopt from the mutator erases the key.
class RateLimitStore {
 public:
  using Mutator = std::function<std::optional<RateWindow>(std::optional<RateWindow>)>;

  virtual ~RateLimitStore() = default;
  virtual std::optional<RateWindow> Update(const std::string& key, const Mutator& mutate) = 0;
  virtual std::optional<RateWindow> Peek(const std::string& key) = 0;
  virtual void Erase(const std::string& key) = 0;
};

class InMemoryRateLimitStore final : public RateLimitStore {
 public:
  std::optional<RateWindow> Update(const std::string& key, const Mutator& mutate) override;
  std::optional<RateWindow> Peek(const std::string& key) override;
  void Erase(const std::string& key) override;

 private:
  std::mutex mutex_;
  std::map<std::string, RateWindow> windows_;
};

// One HMAC-sealed file per key under `directory`, each guarded by its own
// cross-process lock so separate processes draw from the same budget.
class FileRateLimitStore final : public RateLimitStore {
 public:
  explicit FileRateLimitStore(std::filesystem::path directory) : directory_(std::move(directory)) {}

  std::optional<RateWindow> Update(const std::string& key, const Mutator& mutate) override;
  std::optional<RateWindow> Peek(const std::string& key) override;
  void Erase(const std::string& key) override;

  [[nodiscard]] std::filesystem::path PathForKey(const std::string& key) const;

 private:
  std::optional<RateWindow> ReadLocked(const std::filesystem::path& path, const std::string& key) const;
  void WriteLocked(const std::filesystem::path& path, const std::string& key,
                   const std::optional<RateWindow>& window) const;

  std::filesystem::path directory_;
};

// Fixed-window request budgets keyed by operation class. A window opens on
// the first request and resets once `window` has elapsed from its start, so a
// caller can spend up to twice the budget across a boundary.
class RateLimiterRegistry {
 public:
  // Registers the ai-general (30/min), chat (10/min) and receipt-scan (5/min) budgets.
  explicit RateLimiterRegistry(RateLimitStore& store, const Clock& clock = DefaultClock());

  // Adds or replaces a budget. Throws kt::Error{Config} for a zero budget or window.
  void Register(std::string key, Budget budget);
  [[nodiscard]] bool HasBudget(std::string_view key) const;
  [[nodiscard]] const Budget& BudgetFor(std::string_view key) const;

  // Consumes one request when the budget allows it.
  [[nodiscard]] bool IsAllowed(std::string_view key);

  // Like IsAllowed but throws kt::RateLimitedError when the budget is spent.
  void Acquire(std::string_view key);

  // Milliseconds until the open window closes; zero when none is open.
  [[nodiscard]] std::chrono::milliseconds ResetTime(std::string_view key);
  [[nodiscard]] uint32_t RemainingRequests(std::string_view key);
  void Reset(std::string_view key);

 private:
  const Budget& Require(std::string_view key) const;
  bool Expired(const RateWindow& window, const Budget& budget, Clock::TimePoint now) const;

  RateLimitStore& store_;
  const Clock& clock_;
  std::map<std::string, Budget, std::less<>> budgets_;
};

}  // namespace kt::ratelimit
