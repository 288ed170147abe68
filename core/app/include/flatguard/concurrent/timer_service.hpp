#pragma once

#include "flatguard/concurrent/i_scheduler.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <thread>

namespace flatguard {

// -----------------------------------------------------------------------------
// TimerService — single-thread deadline scheduler
// -----------------------------------------------------------------------------
//
// @brief  Keeps callbacks ordered by deadline and runs each one on its own
//         thread when the deadline passes.
//
// @details
// Deadlines use std::chrono::steady_clock, so wall-clock jumps do not fire
// or delay timers. The callback runs with no lock held. Callbacks
// scheduled before start() wait until the thread is running; those still
// pending at stop() are dropped.
//
// Thread model: scheduleAfter() is safe from any thread, including from
//               inside a callback. start()/stop() from the owning thread.
// Ownership:    Owned by TradingEngine.
// -----------------------------------------------------------------------------
class TimerService final : public IScheduler {
 public:
  TimerService() = default;
  ~TimerService() override;

  TimerService(const TimerService&) = delete;
  TimerService& operator=(const TimerService&) = delete;
  TimerService(TimerService&&) = delete;
  TimerService& operator=(TimerService&&) = delete;

  void start();
  void stop();

  void scheduleAfter(std::int64_t delay_ms, Callback callback) override;

  // Number of callbacks still waiting. Diagnostics and tests only.
  std::size_t pending() const;

 private:
  using Clock = std::chrono::steady_clock;

  void run();

  mutable std::mutex mutex_;
  std::condition_variable wake_;
  std::multimap<Clock::time_point, Callback> timers_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace flatguard
