#include "infra/thread_runner.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace rwc {

ThreadRunner::ThreadRunner(std::string name) : name_(std::move(name)) {}

// Destructor safely stops thread on death
ThreadRunner::~ThreadRunner() {
  request_stop();
  if (thread_.joinable() && !is_current_thread()) thread_.join();
  if (thread_.joinable()) thread_.detach();
}

void ThreadRunner::start(Fn fn) {
  if (thread_.joinable()) {
    throw std::logic_error("ThreadRunner '" + name_ + "' already started");
  }

  stop_.reset();
  StopToken token = stop_.token();

  thread_ = std::thread([this, token, fn = std::move(fn)]() mutable {
    try {
      fn(token);
    } catch (const std::exception& e) {
      spdlog::error("[{}] worker exited with exception: {}", name_, e.what());
    }
  });
}

void ThreadRunner::request_stop() {
  stop_.request_stop();
}

bool ThreadRunner::stop_requested() const {
  return stop_.stop_requested();
}

void ThreadRunner::stop() {
  request_stop();
  join();
}

void ThreadRunner::join() {
  // A worker can't join itself; the owner's destructor or next stop() picks it up
  if (is_current_thread()) return;
  if (thread_.joinable()) thread_.join();
}

bool ThreadRunner::joinable() const {
  return thread_.joinable();
}

bool ThreadRunner::is_current_thread() const {
  return thread_.get_id() == std::this_thread::get_id();
}

} // namespace rwc
