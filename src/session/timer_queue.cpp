#include "kt/session/timer_queue.h"

namespace kt::session {

TimerQueue::TimerId TimerQueue::Schedule(Clock::Duration delay, Callback fn) {
  return ScheduleAt(clock_.Now() + delay, std::move(fn));
}

TimerQueue::TimerId TimerQueue::ScheduleAt(Clock::TimePoint deadline, Callback fn) {
  const TimerId id = next_id_++;
  queue_.emplace(Key{deadline, id}, std::move(fn));
  index_.emplace(id, deadline);
  return id;
}

bool TimerQueue::Cancel(TimerId id) noexcept {
  auto it = index_.find(id);
  if (it == index_.end()) {
    return false;
  }
  queue_.erase(Key{it->second, id});
  index_.erase(it);
  return true;
}

bool TimerQueue::IsScheduled(TimerId id) const noexcept {
  return index_.find(id) != index_.end();
}

std::optional<Clock::TimePoint> TimerQueue::NextDeadline() const {
  if (queue_.empty()) {
    return std::nullopt;
  }
  return queue_.begin()->first.first;
}

std::size_t TimerQueue::RunDue() {
  return RunDue(clock_.Now());
}

std::size_t TimerQueue::RunDue(Clock::TimePoint now) {
  std::size_t ran = 0;
  while (!queue_.empty()) {
    auto it = queue_.begin();
    if (it->first.first > now) {
      break;
    }
    // Detach before invoking so the callback sees itself as no longer pending.
    Callback fn = std::move(it->second);
    index_.erase(it->first.second);
    queue_.erase(it);
    if (fn) {
      fn();
    }
    ++ran;
  }
  return ran;
}

void ScopedTimer::Reset(Clock::Duration delay, TimerQueue::Callback fn) {
  Cancel();
  id_ = queue_.Schedule(delay, std::move(fn));
}

void ScopedTimer::Cancel() noexcept {
  if (id_) {
    queue_.Cancel(*id_);
    id_.reset();
  }
}

bool ScopedTimer::armed() const noexcept {
  return id_.has_value() && queue_.IsScheduled(*id_);
}

}  // namespace kt::session
