#pragma once

#include "flatguard/domain/order_intent.hpp"
#include "flatguard/domain/types.hpp"

#include <cstdint>
#include <string>

namespace flatguard {

// -----------------------------------------------------------------------------
// Loop-internal events
// -----------------------------------------------------------------------------
// Posted back onto a shard by the scheduler or by worker threads, so that
// every state change for a position happens on that position's loop.
//
// `generation` ties the event to one exit or kill-switch cycle. A late
// event from an earlier cycle carries a stale generation and is ignored.
// -----------------------------------------------------------------------------

// Periodic drift sweep over every position the shard owns.
struct ReconcileTimerEvent {
  std::uint64_t sequence_id{0};
};

// One exit-confirmation poll.
struct ConfirmPollEvent {
  domain::PositionKey key;
  std::uint64_t generation{0};
};

// Progress of the kill switch's flatten lane. Posted once right after the
// flatten order is accepted (finished == false, so the shard can track the
// order) and once when the lane ends.
struct KillSwitchReportEvent {
  domain::PositionKey key;
  std::uint64_t generation{0};
  bool finished{true};
  bool broker_flat{false};
  std::int64_t broker_quantity{0};
  domain::BrokerOrderId flatten_order_id;   // Empty if no order was needed
  domain::OrderIntent flatten_intent;
  std::int64_t elapsed_ms{0};
  std::string error;
};

// Safety net in case the flatten task never reports.
struct KillSwitchDeadlineEvent {
  domain::PositionKey key;
  std::uint64_t generation{0};
};

}  // namespace flatguard
