#include "infra/repeating_timer.hpp"

#include <utility>

namespace rwc {

RepeatingTimer::RepeatingTimer(std::string name) : runner_(std::move(name)) {}

RepeatingTimer::~RepeatingTimer() {
  stop();
}

void RepeatingTimer::start(std::chrono::milliseconds interval, Tick tick, bool fire_immediately) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (running_) return;
    running_ = true;
    interval_ = interval;
    tick_ = std::move(tick);
    fire_now_ = false;
    interval_changed_ = false;
    first_tick_ = std::chrono::steady_clock::now() + (fire_immediately ? std::chrono::milliseconds(0) : interval);
  }
  runner_.start([this](const StopToken& stop) { loop(stop); });
}

void RepeatingTimer::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!running_) return;
    running_ = false;
  }
  cv_.notify_all();
  runner_.stop();
}

void RepeatingTimer::fire_now() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!running_) return;
    fire_now_ = true;
  }
  cv_.notify_all();
}

void RepeatingTimer::set_interval(std::chrono::milliseconds interval) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    interval_ = interval;
    interval_changed_ = true;
  }
  cv_.notify_all();
}

bool RepeatingTimer::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return running_;
}

std::chrono::milliseconds RepeatingTimer::interval() const {
  std::lock_guard<std::mutex> lock(mu_);
  return interval_;
}

void RepeatingTimer::loop(const StopToken& stop) {
  std::chrono::steady_clock::time_point next_tick;
  Tick tick;
  {
    std::lock_guard<std::mutex> lock(mu_);
    next_tick = first_tick_;
    tick = tick_;
  }

  while (true) {
    bool immediate = false;
    {
      std::unique_lock<std::mutex> lock(mu_);

      // Wait for the deadline, an immediate request, or stop. An interval change re-arms the deadline
      while (running_ && !fire_now_) {
        if (interval_changed_) {
          interval_changed_ = false;
          next_tick = std::chrono::steady_clock::now() + interval_;
        }
        if (cv_.wait_until(lock, next_tick) == std::cv_status::timeout && !interval_changed_) break;
      }

      if (!running_ || stop.stop_requested()) return;

      immediate = fire_now_;
      fire_now_ = false;
    }

    tick(immediate);

    std::lock_guard<std::mutex> lock(mu_);
    next_tick = std::chrono::steady_clock::now() + interval_;
  }
}

} // namespace rwc
