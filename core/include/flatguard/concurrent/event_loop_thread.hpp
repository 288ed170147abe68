#pragma once

#include "flatguard/concurrent/thread_safe_queue.hpp"
#include "flatguard/eventbus/event_bus.hpp"
#include "flatguard/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace flatguard {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its own EventBus. This is the serialized
// consumer behind a shard: every component subscribed to the bus runs on
// this thread only, so position state needs no locks for writes.
//
// Ordering: events are published in push() order. Two events pushed from
// the same producer thread are therefore handled in the order produced.
//
// Thread model: start() and stop() from the owning thread; push() from any
// thread. Subscriber callbacks run only on the loop thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "loop") : name_(std::move(name)) {}

  // Stops and joins, so the queue and bus outlive the worker.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Spawns the worker. Idempotent: a second call while running is a no-op.
  // Events pushed before start() are kept and handled once it runs.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Clears running_, wakes the worker and joins it. Events still queued are
  // left in the queue; a later start() resumes with them. No lock is held
  // across join().
  // -------------------------------------------------------------------------
  void stop();

  // Thread-safe enqueue; the worker publishes the event later.
  void push(Event event) { queue_.push(std::move(event)); }

  // Bus this loop publishes to. Valid for the lifetime of the loop.
  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  const std::string& name() const { return name_; }

  bool running() const { return running_.load(); }

  // Number of events published so far. Monotonic; diagnostics and tests.
  std::uint64_t processed() const { return processed_.load(); }

 private:
  // Worker: try_pop and publish, or wait briefly for stop() to notify.
  void run();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> processed_{0};

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  std::thread thread_;
};

}  // namespace flatguard
