#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>

#include "infra/thread_runner.hpp"

/*
    RepeatingTimer invokes a tick callback every 'interval' on its own thread.

    fire_now() cancels the pending wait, runs one tick immediately and restarts the interval from
    zero, so the next scheduled tick doesn't land right after the out-of-band one. Ticks never overlap
    because every tick, scheduled or immediate, runs on the timer thread. The interval can be changed
    while running and is picked up by the next wait.
*/

namespace rwc {

class RepeatingTimer {
public:
  using Tick = std::function<void(bool immediate)>;

  explicit RepeatingTimer(std::string name);
  ~RepeatingTimer();

  RepeatingTimer(const RepeatingTimer&) = delete;
  RepeatingTimer& operator=(const RepeatingTimer&) = delete;

  // No-op if already running. With fire_immediately the first tick runs right away
  void start(std::chrono::milliseconds interval, Tick tick, bool fire_immediately);

  // Idempotent. Waits for an in-progress tick to finish
  void stop();

  void fire_now();
  void set_interval(std::chrono::milliseconds interval);

  bool running() const;
  std::chrono::milliseconds interval() const;

private:
  void loop(const StopToken& stop);

  ThreadRunner runner_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::chrono::milliseconds interval_{1000};
  Tick tick_;
  std::chrono::steady_clock::time_point first_tick_{};
  bool running_{false};
  bool fire_now_{false};
  bool interval_changed_{false};
};

} // namespace rwc
