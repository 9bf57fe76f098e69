#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

#include "core/config.hpp" // For DropPolicy

/*
    Bounded frame channel shared between producer threads and a single consumer.

    Capture sources push raw frames into one instance (the merged raw channel) and the
    orchestrator publishes deduplicated frames into another (the output stream). When full the
    channel applies its DropPolicy instead of blocking the producer. close() ends the stream:
    pushes are refused, consumers drain what is left and then get PopStatus::Closed.
*/

namespace rwc {

enum class PopStatus { Item, Timeout, Closed };

struct QueueStats {
  std::uint64_t pushes = 0;
  std::uint64_t pops = 0;
  std::uint64_t drops = 0;
  std::size_t depth = 0;
};

template <typename T>
class BoundedQueue {
public:
  BoundedQueue(std::size_t capacity, DropPolicy policy): capacity_(capacity), policy_(policy) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // False when the item was refused (closed, zero capacity, or DropNewest at capacity)
  bool try_push(T item) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      ++stats_.pushes;

      if (closed_ || capacity_ == 0) {
        ++stats_.drops;
        return false;
      }
      if (items_.size() >= capacity_) {
        ++stats_.drops;
        if (policy_ == DropPolicy::DropNewest) return false;
        items_.pop_front();
      }
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  bool try_pop(T& out) {
    std::lock_guard<std::mutex> lock(mu_);
    return take_locked(out);
  }

  // Waits up to timeout for an item. Closed is only reported once the backlog is drained
  template <typename Rep, typename Period>
  PopStatus pop_for(T& out, const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait_for(lock, timeout, [&] { return !items_.empty() || closed_; });
    if (take_locked(out)) return PopStatus::Item;
    return closed_ ? PopStatus::Closed : PopStatus::Timeout;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return items_.size();
  }

  std::size_t capacity() const { return capacity_; }
  DropPolicy policy() const { return policy_; }

  QueueStats stats() const {
    std::lock_guard<std::mutex> lock(mu_);
    QueueStats s = stats_;
    s.depth = items_.size();
    return s;
  }

private:
  bool take_locked(T& out) {
    if (items_.empty()) return false;
    out = std::move(items_.front());
    items_.pop_front();
    ++stats_.pops;
    return true;
  }

  const std::size_t capacity_;
  const DropPolicy policy_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<T> items_;
  bool closed_ = false;
  QueueStats stats_;
};

} // namespace rwc
