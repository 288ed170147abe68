#pragma once

#include "flatguard/concurrent/thread_safe_queue.hpp"

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <vector>

namespace flatguard {

// -----------------------------------------------------------------------------
// WorkerPool — fixed set of threads running blocking broker calls
// -----------------------------------------------------------------------------
//
// @brief  Runs submitted tasks on a small number of dedicated threads and
//         hands back a std::future for each.
//
// @details
// The kill switch must not park its own event loop while the broker
// answers its order cancellations. It submits them here. Its flatten runs
// on a lane of its own and falls back to this pool only when no thread can
// be started.
//
// Tasks live in a ThreadSafeQueue<Task>. An empty Task is the stop
// sentinel: stop() pushes one per thread, so every worker finishes the
// tasks queued before it and then exits.
//
// Futures come from std::packaged_task, so dropping a future never blocks
// (unlike std::async).
//
// Thread model: submit() is safe from any thread. start()/stop() from the
//               owning thread.
// Ownership:    Owned by TradingEngine; outlives every PositionDesk.
// -----------------------------------------------------------------------------
class WorkerPool {
 public:
  using Task = std::function<void()>;

  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // Spawns the threads. Idempotent.
  void start();

  // Drains queued work and joins every thread. Idempotent.
  void stop();

  // -------------------------------------------------------------------------
  // submit(fn)
  // -------------------------------------------------------------------------
  // @brief  Queues fn for execution on a worker thread.
  //
  // @return Future holding fn's result, or the exception fn threw.
  //
  // @details
  // The packaged_task is held by shared_ptr because std::function needs a
  // copyable target and packaged_task is move-only.
  // -------------------------------------------------------------------------
  template <typename Fn>
  auto submit(Fn fn) -> std::future<std::invoke_result_t<Fn>> {
    using Result = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    std::future<Result> future = task->get_future();
    tasks_.push([task] { (*task)(); });
    return future;
  }

  std::size_t size() const { return thread_count_; }

 private:
  void run();

  std::size_t thread_count_;
  ThreadSafeQueue<Task> tasks_;
  std::vector<std::thread> threads_;
};

}  // namespace flatguard
