#pragma once

#include "flatguard/concurrent/i_scheduler.hpp"
#include "flatguard/time/simulation_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace flatguard {
namespace testing_support {

// -----------------------------------------------------------------------------
// ManualScheduler — IScheduler driven by a SimulationTimeProvider
// -----------------------------------------------------------------------------
// Callbacks are due at clock.now_ms() + delay. Nothing runs until the test
// calls advance(), which moves the clock and fires every due callback,
// including ones scheduled by callbacks that just ran.
// -----------------------------------------------------------------------------
class ManualScheduler final : public IScheduler {
 public:
  explicit ManualScheduler(SimulationTimeProvider& clock) : clock_(clock) {}

  void scheduleAfter(std::int64_t delay_ms, Callback callback) override {
    std::lock_guard lock(mutex_);
    timers_.push_back(Timer{clock_.now_ms() + delay_ms, std::move(callback)});
  }

  std::size_t advance(std::int64_t delta_ms) {
    clock_.advance_by(delta_ms);
    return runDue();
  }

  std::size_t runDue() {
    std::size_t fired = 0;
    while (true) {
      Callback next;
      {
        std::lock_guard lock(mutex_);
        const std::int64_t now = clock_.now_ms();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
          if (it->due_ms <= now) {
            next = std::move(it->callback);
            timers_.erase(it);
            break;
          }
        }
      }
      if (!next) {
        return fired;
      }
      next();
      ++fired;
    }
  }

  std::size_t pending() const {
    std::lock_guard lock(mutex_);
    return timers_.size();
  }

 private:
  struct Timer {
    std::int64_t due_ms{0};
    Callback callback;
  };

  SimulationTimeProvider& clock_;
  mutable std::mutex mutex_;
  std::vector<Timer> timers_;
};

}  // namespace testing_support
}  // namespace flatguard
