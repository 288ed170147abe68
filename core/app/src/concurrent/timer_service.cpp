#include "flatguard/concurrent/timer_service.hpp"

#include <iostream>
#include <utility>

namespace flatguard {

TimerService::~TimerService() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TimerService::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop(): wake the thread, join, drop pending timers
// -----------------------------------------------------------------------------
void TimerService::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    running_.store(false);
  }
  wake_.notify_all();
  thread_.join();

  std::lock_guard lock(mutex_);
  if (!timers_.empty()) {
    std::cout << "[TimerService] stopped with " << timers_.size()
              << " pending timer(s) dropped.\n";
  }
  timers_.clear();
}

// -----------------------------------------------------------------------------
// scheduleAfter()
// -----------------------------------------------------------------------------
void TimerService::scheduleAfter(std::int64_t delay_ms, Callback callback) {
  if (delay_ms < 0) {
    delay_ms = 0;
  }
  const auto deadline = Clock::now() + std::chrono::milliseconds(delay_ms);
  {
    std::lock_guard lock(mutex_);
    timers_.emplace(deadline, std::move(callback));
  }
  // A new earliest deadline must shorten the current wait.
  wake_.notify_all();
}

std::size_t TimerService::pending() const {
  std::lock_guard lock(mutex_);
  return timers_.size();
}

// -----------------------------------------------------------------------------
// run(): sleep until the earliest deadline, fire it outside the lock
// -----------------------------------------------------------------------------
void TimerService::run() {
  std::unique_lock lock(mutex_);
  while (running_.load()) {
    if (timers_.empty()) {
      wake_.wait(lock, [this] { return !running_.load() || !timers_.empty(); });
      continue;
    }

    auto earliest = timers_.begin();
    if (Clock::now() < earliest->first) {
      wake_.wait_until(lock, earliest->first);
      continue;
    }

    Callback callback = std::move(earliest->second);
    timers_.erase(earliest);

    lock.unlock();
    callback();
    lock.lock();
  }
}

}  // namespace flatguard
