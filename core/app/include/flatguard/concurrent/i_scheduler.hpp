#pragma once

#include <cstdint>
#include <functional>

namespace flatguard {

// -----------------------------------------------------------------------------
// IScheduler — deferred callbacks for timers that must not block a loop
// -----------------------------------------------------------------------------
//
// @brief  Runs a callback once, no earlier than delay_ms from now.
//
// @details
// Exit confirmation polls, kill-switch deadlines and the periodic drift
// sweep are all "come back later" work. Components never sleep on their
// event loop; they schedule a callback that posts an event back to the
// loop instead. The callback runs on the scheduler's own thread and must
// only enqueue work.
//
// Implementations:
//   TimerService    — dedicated thread, wall-clock deadlines (production).
//   ManualScheduler — test double advanced explicitly by the test.
// -----------------------------------------------------------------------------
class IScheduler {
 public:
  using Callback = std::function<void()>;

  virtual ~IScheduler() = default;

  virtual void scheduleAfter(std::int64_t delay_ms, Callback callback) = 0;
};

}  // namespace flatguard
