#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "infra/thread_runner.hpp"

/*
    SerialExecutor runs posted tasks one at a time, in FIFO order, on a single worker thread.

    The orchestrator uses it as its actor: public calls, frame arrivals and platform notifications are
    all turned into tasks, so its state is only ever touched by this one thread and needs no lock.

    run_sync() posts a task and blocks for its result (exceptions are rethrown in the caller). When it
    is called from the executor thread itself (a callback re-entering the orchestrator) the task runs
    inline instead of deadlocking on its own queue.
*/

namespace rwc {

class SerialExecutor {
public:
  using Task = std::function<void()>;

  explicit SerialExecutor(std::string name);
  ~SerialExecutor();

  SerialExecutor(const SerialExecutor&) = delete;
  SerialExecutor& operator=(const SerialExecutor&) = delete;

  void start();

  // Stops the worker. Tasks still queued are dropped
  void shutdown();

  // Enqueue fire-and-forget work. Returns false if the executor is not running
  bool post(Task task);

  // Enqueue work and return a future for its result
  template <typename F>
  auto submit(F&& fn) -> std::future<std::invoke_result_t<F>> {
    using R = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    std::future<R> fut = task->get_future();
    if (!post([task] { (*task)(); })) {
      throw std::runtime_error("SerialExecutor '" + name_ + "' is not running");
    }
    return fut;
  }

  template <typename F>
  auto run_sync(F&& fn) -> std::invoke_result_t<F> {
    if (on_executor_thread()) return fn();
    return submit(std::forward<F>(fn)).get();
  }

  bool on_executor_thread() const { return runner_.is_current_thread(); }

  std::size_t pending() const;

private:
  void loop(const StopToken& stop);

  std::string name_;
  ThreadRunner runner_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Task> tasks_;
  bool running_{false};
};

} // namespace rwc
