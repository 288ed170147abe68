// =============================================================================
// event_loop_test.cpp
// =============================================================================
// Tests for flatguard::EventLoopThread and flatguard::KeyedLoopGroup.
//
// Validates:
//   - Events pushed from another thread are published on the loop thread
//     in push order
//   - A handler exception is logged and does not stop the loop
//   - A PositionKey always maps to the same shard
//   - broadcast() reaches every shard
//
// Threading model:
//   Handlers signal std::promise objects; the test thread waits on the
//   futures with a bounded timeout.
// =============================================================================

#include "flatguard/concurrent/event_loop_thread.hpp"
#include "flatguard/concurrent/keyed_loop_group.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

flatguard::PriceTickEvent tick(const std::string& symbol, double price) {
  flatguard::PriceTickEvent e;
  e.symbol = symbol;
  e.price = price;
  return e;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Pushed events are dispatched on the loop thread, in order.
// Why: The loop thread is the only writer of its shard's state; handlers
//      running elsewhere would race the ledger.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, DispatchesOnLoopThreadInPushOrder) {
  flatguard::EventLoopThread loop("test");
  std::vector<double> prices;
  std::thread::id handler_thread;
  std::promise<void> done;

  loop.eventBus().subscribe<flatguard::PriceTickEvent>(
      [&](const flatguard::PriceTickEvent& e) {
        handler_thread = std::this_thread::get_id();
        prices.push_back(e.price);
        if (prices.size() == 3) {
          done.set_value();
        }
      });

  loop.start();
  loop.push(tick("MES", 1.0));
  loop.push(tick("MES", 2.0));
  loop.push(tick("MES", 3.0));

  ASSERT_EQ(done.get_future().wait_for(2s), std::future_status::ready)
      << "loop never delivered the events";
  loop.stop();

  EXPECT_NE(handler_thread, std::this_thread::get_id());
  ASSERT_EQ(prices.size(), 3u);
  EXPECT_DOUBLE_EQ(prices[0], 1.0);
  EXPECT_DOUBLE_EQ(prices[2], 3.0);
  EXPECT_EQ(loop.processed(), 3u);
}

// -----------------------------------------------------------------------------
// 2. An exception escaping a handler does not stop the loop.
// Why: One bad event must not freeze every position pinned to the shard.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, HandlerExceptionDoesNotStopLoop) {
  flatguard::EventLoopThread loop("throwing");
  std::promise<double> second;

  loop.eventBus().subscribe<flatguard::PriceTickEvent>(
      [&](const flatguard::PriceTickEvent& e) {
        if (e.price < 0.0) {
          throw std::runtime_error("bad tick");
        }
        second.set_value(e.price);
      });

  loop.start();
  loop.push(tick("MES", -1.0));
  loop.push(tick("MES", 42.0));

  auto future = second.get_future();
  ASSERT_EQ(future.wait_for(2s), std::future_status::ready)
      << "loop died after the handler threw";
  EXPECT_DOUBLE_EQ(future.get(), 42.0);
  EXPECT_TRUE(loop.running());
}

// -----------------------------------------------------------------------------
// 3. A key always lands on the same shard, and shard indices stay in range.
// Why: Per-position ordering only holds if every event for a key goes
//      through one loop.
// -----------------------------------------------------------------------------
TEST(KeyedLoopGroupTest, KeyIsPinnedToOneShard) {
  flatguard::KeyedLoopGroup group(4);
  const flatguard::domain::PositionKey key{"ACC1", "MES"};

  const std::size_t first = group.indexFor(key);
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(group.indexFor(key), first);
  }
  EXPECT_EQ(&group.loopFor(key), &group.loop(first));

  for (const char* symbol : {"MES", "MNQ", "ES", "NQ", "AAPL", "MSFT"}) {
    EXPECT_LT(group.indexFor({"ACC2", symbol}), group.size());
  }

  flatguard::KeyedLoopGroup single(0);
  EXPECT_EQ(single.size(), 1u);
}

// -----------------------------------------------------------------------------
// 4. broadcast() delivers one copy of the event to every shard.
// Why: The reconcile timer is broadcast; a shard missing it never sweeps.
// -----------------------------------------------------------------------------
TEST(KeyedLoopGroupTest, BroadcastReachesEveryShard) {
  constexpr std::size_t kShards = 3;
  flatguard::KeyedLoopGroup group(kShards);
  std::atomic<int> received{0};
  std::promise<void> all;

  for (std::size_t i = 0; i < kShards; ++i) {
    group.loop(i).eventBus().subscribe<flatguard::ReconcileTimerEvent>(
        [&](const flatguard::ReconcileTimerEvent&) {
          if (received.fetch_add(1) + 1 == static_cast<int>(kShards)) {
            all.set_value();
          }
        });
  }

  group.start();
  group.broadcast(flatguard::ReconcileTimerEvent{1});

  ASSERT_EQ(all.get_future().wait_for(2s), std::future_status::ready)
      << "only " << received.load() << " shard(s) saw the broadcast";
  group.stop();
  EXPECT_EQ(received.load(), static_cast<int>(kShards));
}
