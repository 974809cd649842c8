#pragma once

#include <chrono>
#include <mutex>

namespace kt {

// Wall clock source. Lockout windows, rate-limit windows and idle deadlines are
// all measured against it, so a system clock step perturbs them.
class Clock {
 public:
  using TimePoint = std::chrono::system_clock::time_point;
  using Duration = std::chrono::system_clock::duration;

  virtual ~Clock() = default;
  virtual TimePoint Now() const = 0;
};

class SystemClock final : public Clock {
 public:
  TimePoint Now() const override { return std::chrono::system_clock::now(); }
};

// Process-wide default used when no clock is injected.
Clock& DefaultClock();

// Test clock advanced by hand.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start = TimePoint(std::chrono::seconds(1'700'000'000)))
      : now_(start) {}

  TimePoint Now() const override {
    std::lock_guard<std::mutex> guard(mutex_);
    return now_;
  }

  void Advance(Duration delta) {
    std::lock_guard<std::mutex> guard(mutex_);
    now_ += delta;
  }

  void Set(TimePoint value) {
    std::lock_guard<std::mutex> guard(mutex_);
    now_ = value;
  }

 private:
  mutable std::mutex mutex_;
  TimePoint now_;
};

}  // namespace kt
