#pragma once

#include "flatguard/broker/i_broker_api.hpp"
#include "flatguard/domain/errors.hpp"
#include "flatguard/pnl/pnl_math.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace flatguard {
namespace testing_support {

// -----------------------------------------------------------------------------
// ScriptedBroker — programmable IBrokerApi for component tests
// -----------------------------------------------------------------------------
// Holds a per-key position book and fill history that tests set directly
// or move through execute(). Nothing is pushed: tests publish the
// BrokerFillEvent themselves so they control ordering on the bus.
//
// Thread model:
//   All methods lock one mutex. KillSwitch tests call it from worker
//   threads while the test thread inspects it.
// -----------------------------------------------------------------------------
class ScriptedBroker final : public IBrokerApi {
 public:
  struct PlacedOrder {
    domain::BrokerOrderId id;
    domain::OrderIntent intent;
    bool working{true};
  };

  domain::BrokerOrderId placeOrder(const domain::OrderIntent& intent) override {
    std::lock_guard lock(mutex_);
    ++place_calls_;
    if (!rejections_.empty()) {
      const std::string reason = rejections_.front();
      rejections_.pop_front();
      throw RejectError(reason);
    }
    if (transient_placements_ > 0) {
      --transient_placements_;
      throw TransientBrokerError("scripted placement timeout");
    }
    PlacedOrder order;
    order.id = "ORD-" + std::to_string(++order_sequence_);
    order.intent = intent;
    orders_.push_back(order);
    if (market_fill_price_ && intent.type == domain::OrderType::Market) {
      executeLocked(order.id, *market_fill_price_);
    }
    return order.id;
  }

  void cancelOrder(const domain::AccountId& /*account_id*/,
                   const domain::BrokerOrderId& order_id) override {
    std::lock_guard lock(mutex_);
    cancels_.push_back(order_id);
    PlacedOrder* order = findLocked(order_id);
    if (order == nullptr || !order->working) {
      throw NotFoundError("unknown order " + order_id);
    }
    order->working = false;
  }

  BrokerPosition queryPosition(const domain::AccountId& account_id,
                               const domain::Symbol& symbol) override {
    std::chrono::milliseconds delay{0};
    {
      std::lock_guard lock(mutex_);
      delay = query_delay_;
    }
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }
    std::lock_guard lock(mutex_);
    ++position_queries_;
    if (failing_queries_ > 0) {
      --failing_queries_;
      throw TransientBrokerError("scripted query timeout");
    }
    BrokerPosition position;
    auto it = books_.find(domain::PositionKey{account_id, symbol});
    if (it != books_.end()) {
      position.quantity = it->second.quantity;
      position.average_price = it->second.average_price;
    }
    position.side = domain::positionSideFor(position.quantity);
    return position;
  }

  std::vector<domain::BrokerOrderId> queryOrders(
      const domain::AccountId& account_id,
      const domain::Symbol& symbol) override {
    std::lock_guard lock(mutex_);
    std::vector<domain::BrokerOrderId> ids;
    for (const PlacedOrder& order : orders_) {
      if (order.working && order.intent.account_id == account_id &&
          order.intent.symbol == symbol) {
        ids.push_back(order.id);
      }
    }
    return ids;
  }

  std::vector<domain::Fill> queryFills(const domain::AccountId& account_id,
                                       const domain::Symbol& symbol) override {
    std::lock_guard lock(mutex_);
    auto it = books_.find(domain::PositionKey{account_id, symbol});
    return it == books_.end() ? std::vector<domain::Fill>{} : it->second.fills;
  }

  // --- Scripting -------------------------------------------------------------

  void setPosition(const domain::PositionKey& key, std::int64_t quantity,
                   double average_price = 0.0) {
    std::lock_guard lock(mutex_);
    Book& book = books_[key];
    book.quantity = quantity;
    book.average_price = average_price;
  }

  // Adds a fill to the broker history without touching the position.
  void addHistoryFill(const domain::Fill& fill) {
    std::lock_guard lock(mutex_);
    books_[fill.key()].fills.push_back(fill);
  }

  void rejectNextOrder(std::string reason) {
    std::lock_guard lock(mutex_);
    rejections_.push_back(std::move(reason));
  }

  void failNextPlacement() {
    std::lock_guard lock(mutex_);
    ++transient_placements_;
  }

  void failNextQueries(int count) {
    std::lock_guard lock(mutex_);
    failing_queries_ = count;
  }

  // Every position query blocks the caller this long before answering.
  void delayPositionQueries(std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    query_delay_ = delay;
  }

  // Market orders book immediately at this price (no push).
  void fillMarketOrdersAt(std::optional<double> price) {
    std::lock_guard lock(mutex_);
    market_fill_price_ = price;
  }

  // Fills a working order in full at the broker and returns the fill the
  // broker would push.
  domain::Fill execute(const domain::BrokerOrderId& order_id, double price) {
    std::lock_guard lock(mutex_);
    return executeLocked(order_id, price);
  }

  std::vector<PlacedOrder> placed() const {
    std::lock_guard lock(mutex_);
    return orders_;
  }

  std::optional<PlacedOrder> lastPlaced() const {
    std::lock_guard lock(mutex_);
    if (orders_.empty()) {
      return std::nullopt;
    }
    return orders_.back();
  }

  std::vector<domain::BrokerOrderId> cancels() const {
    std::lock_guard lock(mutex_);
    return cancels_;
  }

  int placeCalls() const {
    std::lock_guard lock(mutex_);
    return place_calls_;
  }

  int positionQueries() const {
    std::lock_guard lock(mutex_);
    return position_queries_;
  }

  std::int64_t positionOf(const domain::PositionKey& key) const {
    std::lock_guard lock(mutex_);
    auto it = books_.find(key);
    return it == books_.end() ? 0 : it->second.quantity;
  }

 private:
  struct Book {
    std::int64_t quantity{0};
    double average_price{0.0};
    std::vector<domain::Fill> fills;
  };

  PlacedOrder* findLocked(const domain::BrokerOrderId& id) {
    for (PlacedOrder& order : orders_) {
      if (order.id == id) {
        return &order;
      }
    }
    return nullptr;
  }

  domain::Fill executeLocked(const domain::BrokerOrderId& order_id,
                             double price) {
    PlacedOrder* order = findLocked(order_id);
    if (order == nullptr || !order->working) {
      throw NotFoundError("cannot execute " + order_id);
    }
    order->working = false;

    domain::Fill fill;
    fill.fill_id = "F-" + std::to_string(++fill_sequence_);
    fill.order_id = order->id;
    fill.account_id = order->intent.account_id;
    fill.symbol = order->intent.symbol;
    fill.side = order->intent.side;
    fill.quantity = order->intent.quantity;
    fill.price = price;

    Book& book = books_[fill.key()];
    const pnl::FillEffect effect = pnl::applySignedFill(
        book.quantity, book.average_price, fill.signedQuantity(), price, 1.0);
    book.quantity = effect.quantity;
    book.average_price = effect.average_price;
    book.fills.push_back(fill);
    return fill;
  }

  mutable std::mutex mutex_;
  std::map<domain::PositionKey, Book> books_;
  std::vector<PlacedOrder> orders_;
  std::vector<domain::BrokerOrderId> cancels_;
  std::deque<std::string> rejections_;
  std::optional<double> market_fill_price_;
  std::chrono::milliseconds query_delay_{0};
  int transient_placements_{0};
  int failing_queries_{0};
  int place_calls_{0};
  int position_queries_{0};
  std::uint64_t order_sequence_{0};
  std::uint64_t fill_sequence_{0};
};

}  // namespace testing_support
}  // namespace flatguard
