#pragma once

#include "flatguard/concurrent/event_loop_thread.hpp"
#include "flatguard/domain/types.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace flatguard {

// -----------------------------------------------------------------------------
// KeyedLoopGroup — one serialized slot per (account, symbol)
// -----------------------------------------------------------------------------
//
// @brief  A fixed set of EventLoopThreads. Each PositionKey is pinned to one
//         loop by hash, so all events for a position are processed on the
//         same thread in arrival order, while different positions run in
//         parallel on different loops.
//
// @details
// Pinning by hash gives per-key serialization without a thread per key.
// Two keys may share a loop; they are then serialized with each other,
// which is allowed (no cross-key ordering is promised either way).
//
// Events that concern every position (price ticks, the periodic drift
// sweep, rejects without a symbol) go to every loop via broadcast().
//
// Thread model:
//   start()/stop() from the owning thread. push()/broadcast()/indexFor()
//   from any thread.
//
// Ownership:
//   Owns the loops. Components subscribed to a loop's bus must be destroyed
//   before the group.
// -----------------------------------------------------------------------------
class KeyedLoopGroup {
 public:
  explicit KeyedLoopGroup(std::size_t loops);

  KeyedLoopGroup(const KeyedLoopGroup&) = delete;
  KeyedLoopGroup& operator=(const KeyedLoopGroup&) = delete;

  void start();
  void stop();

  std::size_t size() const { return loops_.size(); }

  // Loop index that owns `key`. Stable for the life of the process.
  std::size_t indexFor(const domain::PositionKey& key) const;

  EventLoopThread& loop(std::size_t index) { return *loops_.at(index); }
  EventLoopThread& loopFor(const domain::PositionKey& key) {
    return loop(indexFor(key));
  }

  void push(const domain::PositionKey& key, Event event);
  void broadcast(const Event& event);

 private:
  std::vector<std::unique_ptr<EventLoopThread>> loops_;
};

}  // namespace flatguard
