#include "kt/session/timer_queue.h"

#include <cassert>
#include <chrono>
#include <iostream>
#include <vector>

int main() {
  using namespace std::chrono_literals;

  kt::ManualClock clock;
  kt::session::TimerQueue queue(clock);
  std::vector<int> fired;

  auto late = queue.Schedule(30ms, [&] { fired.push_back(3); });
  auto early = queue.Schedule(10ms, [&] { fired.push_back(1); });
  auto cancelled = queue.Schedule(20ms, [&] { fired.push_back(2); });
  assert(queue.Pending() == 3);
  assert(queue.NextDeadline() == clock.Now() + 10ms);

  assert(queue.Cancel(cancelled));
  assert(!queue.Cancel(cancelled));
  assert(!queue.IsScheduled(cancelled));

  assert(queue.RunDue() == 0);
  clock.Advance(10ms);
  assert(queue.RunDue() == 1);
  assert(!queue.IsScheduled(early));
  assert(queue.IsScheduled(late));

  clock.Advance(50ms);
  assert(queue.RunDue() == 1);
  assert((fired == std::vector<int>{1, 3}));
  assert(queue.Pending() == 0);
  assert(!queue.NextDeadline().has_value());

  // A callback can schedule more work; work that is already due runs in the same pass.
  fired.clear();
  queue.Schedule(0ms, [&] {
    fired.push_back(10);
    queue.Schedule(0ms, [&] { fired.push_back(11); });
    queue.Schedule(1s, [&] { fired.push_back(12); });
  });
  assert(queue.RunDue() == 2);
  assert((fired == std::vector<int>{10, 11}));
  assert(queue.Pending() == 1);

  {
    // ScopedTimer keeps exactly one timer alive however often it is reset.
    kt::session::TimerQueue idle_queue(clock);
    int expirations = 0;
    {
      kt::session::ScopedTimer timer(idle_queue);
      assert(!timer.armed());
      for (int i = 0; i < 5; ++i) {
        timer.Reset(100ms, [&] { ++expirations; });
        assert(idle_queue.Pending() == 1);
      }
      assert(timer.armed());
      clock.Advance(100ms);
      assert(idle_queue.RunDue() == 1);
      assert(expirations == 1);
      assert(!timer.armed());

      timer.Reset(100ms, [&] { ++expirations; });
      timer.Cancel();
      assert(idle_queue.Pending() == 0);
      timer.Reset(100ms, [&] { ++expirations; });
    }
    // Destruction cancelled the last one.
    assert(idle_queue.Pending() == 0);
    clock.Advance(1s);
    assert(idle_queue.RunDue() == 0);
    assert(expirations == 1);
  }

  std::cout << "timer queue tests ok\n";
  return 0;
}
