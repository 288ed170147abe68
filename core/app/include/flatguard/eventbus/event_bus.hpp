#pragma once

#include "flatguard/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace flatguard {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel of one shard. The shard's event
// loop publishes inbound events; components subscribe to the types they
// handle and publish their own outbound events (PositionChangedEvent,
// ExitStateChangedEvent, ...) on the same bus.
//
// Delivery order: subscribers run in subscription order. PositionDesk
// relies on this to deliver broker fills to OrderTracker before
// PositionLedger, and to the ledger before DCA / exit / reconciler.
//
// Thread model: subscribe, unsubscribe and publish are safe from any
// thread. Callbacks run synchronously on the publishing thread, which for
// a shard bus is always that shard's loop thread. A callback may publish;
// nested events are delivered before the outer publish() returns.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback for every event. Returns the id for unsubscribe().
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // @brief  Registers a callback invoked only for events holding EventType.
  //
  // @return SubscriptionId for unsubscribe().
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription. A publish() already in progress on another
  // thread may still invoke it once.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // @brief  Invokes every current subscriber with the event.
  //
  // @details
  // The subscriber list is copied under the lock and the callbacks run
  // without it, so a callback may subscribe, unsubscribe or publish.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

// -----------------------------------------------------------------------------
// SubscriptionSet
// -----------------------------------------------------------------------------
// @brief  Remembers the subscriptions a component made and removes them all
//         on destruction.
//
// @details
// Components subscribe in their constructor and must be unsubscribed before
// the bus goes away. Holding a SubscriptionSet member (declared after the
// bus reference) makes that automatic and keeps destructors trivial.
// -----------------------------------------------------------------------------
class SubscriptionSet {
 public:
  explicit SubscriptionSet(EventBus& bus) : bus_(bus) {}
  ~SubscriptionSet() { clear(); }

  SubscriptionSet(const SubscriptionSet&) = delete;
  SubscriptionSet& operator=(const SubscriptionSet&) = delete;

  template <typename EventType>
  void add(std::function<void(const EventType&)> callback) {
    ids_.push_back(bus_.subscribe<EventType>(std::move(callback)));
  }

  // Unsubscribes in reverse order of subscription.
  void clear() {
    for (auto it = ids_.rbegin(); it != ids_.rend(); ++it) {
      bus_.unsubscribe(*it);
    }
    ids_.clear();
  }

 private:
  EventBus& bus_;
  std::vector<EventBus::SubscriptionId> ids_;
};

}  // namespace flatguard
