#include "flatguard/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace flatguard {

namespace {

// Idle wait between queue checks. Bounds how long stop() waits for the
// worker and how stale an empty-queue wakeup can be.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  stop_cv_.notify_all();
  thread_.join();
}

// -----------------------------------------------------------------------------
// run() — worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.try_pop();

    if (event) {
      // A handler that lets an exception escape must not take the whole
      // shard down with it; the event is logged and the loop carries on.
      // Components catch the errors they expect themselves.
      try {
        bus_.publish(*event);
      } catch (const std::exception& e) {
        std::cerr << "[EventLoopThread:" << name_
                  << "] ERROR: unhandled exception in event handler (variant "
                  << event->index() << "): " << e.what() << "\n";
      }
      processed_.fetch_add(1);
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }
}

}  // namespace flatguard
