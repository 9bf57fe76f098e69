#pragma once
#include <functional>
#include <string>
#include <thread>

#include "infra/stop_token.hpp"

/*
    ThreadRunner is a simple utility for basic thread usage. It owns one worker thread.
    It provides:
        - Consistent start/stop behavior
        - A StopToken the worker polls (or sleeps on) to know when to exit
        - Restartability: after join() the runner can be started again

    Capture sources, the orchestrator's frame pump and the window settle worker all run on one.
*/

namespace rwc {

class ThreadRunner {
public:
  // Function signature for thread
  // Any callable that takes the runner's stop token and returns nothing
  using Fn = std::function<void(const StopToken&)>;

  ThreadRunner() = default;
  explicit ThreadRunner(std::string name);

  // Remove copy/move
  ThreadRunner(const ThreadRunner&) = delete;
  ThreadRunner& operator=(const ThreadRunner&) = delete;

  ~ThreadRunner();

  // Start the thread. Throws std::logic_error if it is already running
  void start(Fn fn);

  // Request this specific thread to stop. Wakes any StopToken::wait_for in progress
  void request_stop();
  bool stop_requested() const;

  // Request stop and wait for the worker to return
  void stop();

  void join();
  bool joinable() const;

  // True when called from the worker thread itself
  bool is_current_thread() const;

  const std::string& name() const { return name_; }

private:
  std::thread thread_;
  StopSource stop_;
  std::string name_{"thread"};
};

} // namespace rwc
