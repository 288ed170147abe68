#include "flatguard/concurrent/keyed_loop_group.hpp"

#include <string>

namespace flatguard {

KeyedLoopGroup::KeyedLoopGroup(std::size_t loops) {
  if (loops == 0) {
    loops = 1;
  }
  loops_.reserve(loops);
  for (std::size_t i = 0; i < loops; ++i) {
    loops_.push_back(
        std::make_unique<EventLoopThread>("shard-" + std::to_string(i)));
  }
}

void KeyedLoopGroup::start() {
  for (auto& loop : loops_) {
    loop->start();
  }
}

void KeyedLoopGroup::stop() {
  for (auto& loop : loops_) {
    loop->stop();
  }
}

std::size_t KeyedLoopGroup::indexFor(const domain::PositionKey& key) const {
  return domain::PositionKeyHash{}(key) % loops_.size();
}

void KeyedLoopGroup::push(const domain::PositionKey& key, Event event) {
  loops_[indexFor(key)]->push(std::move(event));
}

void KeyedLoopGroup::broadcast(const Event& event) {
  for (auto& loop : loops_) {
    loop->push(event);
  }
}

}  // namespace flatguard
