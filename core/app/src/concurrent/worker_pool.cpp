#include "flatguard/concurrent/worker_pool.hpp"

namespace flatguard {

// -----------------------------------------------------------------------------
// Constructor: at least one worker, never zero
// -----------------------------------------------------------------------------
WorkerPool::WorkerPool(std::size_t threads)
    : thread_count_(threads == 0 ? 1 : threads) {}

WorkerPool::~WorkerPool() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void WorkerPool::start() {
  if (!threads_.empty()) {
    return;
  }
  threads_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back([this] { run(); });
  }
}

// -----------------------------------------------------------------------------
// stop(): one empty sentinel per worker, then join
// -----------------------------------------------------------------------------
void WorkerPool::stop() {
  if (threads_.empty()) {
    return;
  }
  for (std::size_t i = 0; i < threads_.size(); ++i) {
    tasks_.push(Task{});
  }
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void WorkerPool::run() {
  while (true) {
    Task task = tasks_.pop();
    if (!task) {
      return;
    }
    // packaged_task stores exceptions in its future, so task() never throws.
    task();
  }
}

}  // namespace flatguard
