#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

#include "kt/clock.h"

namespace kt::session {

// Single-threaded deadline queue driven by the owner's event loop. Nothing
// fires on its own; RunDue() runs every callback whose deadline has passed.
class TimerQueue {
 public:
  using TimerId = uint64_t;
  using Callback = std::function<void()>;

  explicit TimerQueue(const Clock& clock = DefaultClock()) : clock_(clock) {}

  TimerQueue(const TimerQueue&) = delete;
  TimerQueue& operator=(const TimerQueue&) = delete;

  TimerId Schedule(Clock::Duration delay, Callback fn);
  TimerId ScheduleAt(Clock::TimePoint deadline, Callback fn);

  // False when the id already fired or was cancelled.
  bool Cancel(TimerId id) noexcept;

  [[nodiscard]] bool IsScheduled(TimerId id) const noexcept;
  [[nodiscard]] std::size_t Pending() const noexcept { return index_.size(); }
  [[nodiscard]] std::optional<Clock::TimePoint> NextDeadline() const;

  // Runs due callbacks in deadline order and returns how many ran. Callbacks
  // may schedule or cancel timers; new timers that are already due also run.
  std::size_t RunDue();
  std::size_t RunDue(Clock::TimePoint now);

  [[nodiscard]] const Clock& clock() const noexcept { return clock_; }

 private:
  using Key = std::pair<Clock::TimePoint, TimerId>;

  const Clock& clock_;
  TimerId next_id_{1};
  std::map<Key, Callback> queue_;
  std::unordered_map<TimerId, Clock::TimePoint> index_;
};

// Owns at most one live timer on a queue. Re-arming cancels the previous timer
// first, and destruction cancels whatever is still pending.
class ScopedTimer {
 public:
  explicit ScopedTimer(TimerQueue& queue) noexcept : queue_(queue) {}
  ~ScopedTimer() { Cancel(); }

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

  void Reset(Clock::Duration delay, TimerQueue::Callback fn);
  void Cancel() noexcept;
  [[nodiscard]] bool armed() const noexcept;

 private:
  TimerQueue& queue_;
  std::optional<TimerQueue::TimerId> id_;
};

}  // namespace kt::session
