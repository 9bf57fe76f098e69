#include "infra/serial_executor.hpp"

#include <spdlog/spdlog.h>

namespace rwc {

SerialExecutor::SerialExecutor(std::string name) : name_(std::move(name)), runner_(name_) {}

SerialExecutor::~SerialExecutor() {
  shutdown();
}

void SerialExecutor::start() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (running_) return;
    running_ = true;
  }
  runner_.start([this](const StopToken& stop) { loop(stop); });
}

void SerialExecutor::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!running_) return;
    running_ = false;
    tasks_.clear();
  }
  cv_.notify_all();
  runner_.stop();
}

bool SerialExecutor::post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!running_) return false;
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::size_t SerialExecutor::pending() const {
  std::lock_guard<std::mutex> lock(mu_);
  return tasks_.size();
}

void SerialExecutor::loop(const StopToken& stop) {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [&] { return !tasks_.empty() || !running_; });
      if (!running_ || stop.stop_requested()) return;

      task = std::move(tasks_.front());
      tasks_.pop_front();
    }

    // A throwing fire-and-forget task must not take the actor down with it
    try {
      task();
    } catch (const std::exception& e) {
      spdlog::error("[{}] task failed: {}", name_, e.what());
    }
  }
}

} // namespace rwc
