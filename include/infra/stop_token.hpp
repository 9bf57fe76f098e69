#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

/*
    StopToken / StopSource is a small utility for cooperative thread shutdown.

    A StopSource is owned by whoever owns the thread (ThreadRunner, RepeatingTimer, the settle worker)
    and represents the stop request for that thread.

    A StopToken is a read-only view into a StopSource handed to the worker. Besides polling
    stop_requested(), a worker can sleep with wait_for(), which returns early as soon as a stop is
    requested. That is what makes timer intervals and window settle waits cancellable.
*/

namespace rwc {

namespace detail {

struct StopState {
  std::mutex mu;
  std::condition_variable cv;
  bool stopped{false};
};

} // namespace detail

class StopToken {
public:
  StopToken() = default;
  explicit StopToken(std::shared_ptr<detail::StopState> state) : state_(std::move(state)) {}

  bool stop_requested() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mu);
    return state_->stopped;
  }

  // Sleeps for up to 'timeout'. Returns true if a stop was requested before or during the wait
  template <typename Rep, typename Period>
  bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
    if (!state_) return false;
    std::unique_lock<std::mutex> lock(state_->mu);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->stopped; });
  }

private:
  std::shared_ptr<detail::StopState> state_;
};

class StopSource {
public:
  StopSource() : state_(std::make_shared<detail::StopState>()) {}

  StopToken token() const { return StopToken(state_); }

  void request_stop() {
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      state_->stopped = true;
    }
    state_->cv.notify_all();
  }

  bool stop_requested() const {
    std::lock_guard<std::mutex> lock(state_->mu);
    return state_->stopped;
  }

  // Re-arm the source so the owning thread can be started again
  void reset() {
    std::lock_guard<std::mutex> lock(state_->mu);
    state_->stopped = false;
  }

private:
  std::shared_ptr<detail::StopState> state_;
};

} // namespace rwc
