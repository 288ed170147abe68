#include "flatguard/exit/exit_state_machine.hpp"
#include "flatguard/domain/errors.hpp"
#include "flatguard/events/engine_events.hpp"
#include "flatguard/time/time_utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <vector>

namespace flatguard {

const char* toString(RejectedExitPolicy policy) {
  switch (policy) {
    case RejectedExitPolicy::RequireManualClear:   return "manual";
    case RejectedExitPolicy::RetryOnce:            return "retry_once";
    case RejectedExitPolicy::EscalateToKillSwitch: return "kill_switch";
  }
  return "unknown";
}

std::optional<RejectedExitPolicy> parseRejectedExitPolicy(const std::string& text) {
  if (text == "manual") return RejectedExitPolicy::RequireManualClear;
  if (text == "retry_once") return RejectedExitPolicy::RetryOnce;
  if (text == "kill_switch") return RejectedExitPolicy::EscalateToKillSwitch;
  return std::nullopt;
}

ExitStateMachine::ExitStateMachine(EventBus& bus, PositionLedger& ledger,
                                   OrderTracker& tracker, BrokerGateway& gateway,
                                   const DcaEngine& dca,
                                   DriftReconciler& reconciler,
                                   KillSwitch& kill_switch, IScheduler& scheduler,
                                   EventSink post,
                                   const ITimeProvider& time_provider,
                                   ExitSettings settings)
    : bus_(bus),
      ledger_(ledger),
      tracker_(tracker),
      gateway_(gateway),
      dca_(dca),
      reconciler_(reconciler),
      kill_switch_(kill_switch),
      scheduler_(scheduler),
      post_(std::move(post)),
      time_provider_(time_provider),
      settings_(settings),
      subscriptions_(bus) {
  subscriptions_.add<PriceTickEvent>(
      [this](const PriceTickEvent& e) { onTick(e); });
  subscriptions_.add<PositionChangedEvent>(
      [this](const PositionChangedEvent& e) { onPositionChanged(e); });
  subscriptions_.add<OrderRejectedEvent>(
      [this](const OrderRejectedEvent& e) { onOrderRejected(e); });
  subscriptions_.add<ConfirmPollEvent>(
      [this](const ConfirmPollEvent& e) { onConfirmPoll(e); });
  subscriptions_.add<ExitStateChangedEvent>(
      [this](const ExitStateChangedEvent& e) { onExitStateChanged(e); });
}

domain::ExitState ExitStateMachine::state(const domain::PositionKey& key) const {
  return ledger_.currentPosition(key).exit_state;
}

void ExitStateMachine::forget(const domain::PositionKey& key) {
  cycles_.erase(key);
}

// -----------------------------------------------------------------------------
// requestExit: IDLE → PREPARE_EXIT → WORKING_EXIT
// -----------------------------------------------------------------------------
domain::CommandResult ExitStateMachine::requestExit(
    const domain::PositionKey& key, const std::string& reason) {
  const domain::Position position = ledger_.currentPosition(key);

  if (position.exit_state != domain::ExitState::Idle) {
    return {false, position.exit_state, "exit already in progress"};
  }
  if (position.halted) {
    return {false, position.exit_state, "halted; operator reset required"};
  }
  if (position.isFlat()) {
    // The ledger can be flat after a drift while the broker still holds
    // contracts; only a flat broker refuses the exit.
    try {
      if (gateway_.queryPosition(key.account_id, key.symbol).quantity == 0) {
        return {false, domain::ExitState::Idle, "position already flat"};
      }
    } catch (const TransientBrokerError& e) {
      return {false, domain::ExitState::Idle,
              std::string("ledger flat, broker position unavailable: ") +
                  e.what()};
    }
  }

  if (!ledger_.setExitState(key, domain::ExitState::PrepareExit, reason)) {
    return {false, state(key), "exit refused"};
  }
  ExitCycle& cycle = cycles_[key];
  cycle = ExitCycle{};
  cycle.generation = next_generation_++;
  cycle.reason = reason;

  std::cout << "[ExitStateMachine] exit " << key.toString() << " (" << reason
            << "), ledger qty " << position.quantity << "\n";

  cancelWorkingOrders(key);

  BrokerPosition broker;
  try {
    broker = gateway_.queryPosition(key.account_id, key.symbol);
  } catch (const TransientBrokerError& e) {
    // Protective orders stay cancelled; the operator decides how to size.
    const std::string message =
        std::string("exit aborted, broker position unavailable: ") + e.what();
    ledger_.setExitState(key, domain::ExitState::Idle, message);
    ledger_.setNeedsAttention(key, true);
    alert(key, AlertEvent::Severity::Warning, message);
    return {false, domain::ExitState::Idle, message};
  }

  try {
    ledger_.verifyAgainstBroker(key, broker.quantity);
  } catch (const DriftDetectedError& e) {
    std::cerr << "[ExitStateMachine] " << e.what()
              << "; correcting before exit\n";
    reconciler_.correctToBroker(key, broker, "exit sizing");
  }

  if (broker.quantity == 0) {
    finalize(key, "broker already flat");
    return {true, state(key), "broker already flat"};
  }
  return submitExit(key, broker.quantity);
}

// -----------------------------------------------------------------------------
// cancelWorkingOrders: local book plus whatever the broker still lists
// -----------------------------------------------------------------------------
void ExitStateMachine::cancelWorkingOrders(const domain::PositionKey& key) {
  std::vector<domain::BrokerOrderId> ids = tracker_.workingOrders(key);
  try {
    for (const domain::BrokerOrderId& id :
         gateway_.queryOrders(key.account_id, key.symbol)) {
      if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
        ids.push_back(id);
      }
    }
  } catch (const TransientBrokerError& e) {
    std::cerr << "[ExitStateMachine] broker order list for " << key.toString()
              << " unavailable: " << e.what() << "\n";
  }

  for (const domain::BrokerOrderId& id : ids) {
    try {
      gateway_.cancelOrder(key.account_id, id);
      tracker_.markCanceled(id);
    } catch (const NotFoundError&) {
      tracker_.markCanceled(id);
    } catch (const FlatguardError& e) {
      std::cerr << "[ExitStateMachine] cancel " << id << " failed: "
                << e.what() << "; exit proceeds\n";
    }
  }
}

// -----------------------------------------------------------------------------
// submitExit: market order for the broker quantity, start confirmation
// -----------------------------------------------------------------------------
domain::CommandResult ExitStateMachine::submitExit(const domain::PositionKey& key,
                                                   std::int64_t broker_quantity) {
  ExitCycle& cycle = cycles_[key];
  const domain::OrderIntent intent = domain::OrderIntent::exit(
      key, domain::closingSide(broker_quantity), std::llabs(broker_quantity));

  std::string note;
  try {
    cycle.exit_order_id = gateway_.placeOrder(intent);
    tracker_.track(cycle.exit_order_id, intent, time_provider_.now_ms());
    note = "exit order " + cycle.exit_order_id;
  } catch (const RejectError& e) {
    return handleRejectedExit(key, e.reason());
  } catch (const TransientBrokerError& e) {
    // The order may have reached the broker. Placing another one risks a
    // double exit, so confirmation polling decides.
    cycle.exit_order_id.clear();
    note = std::string("exit order outcome unknown: ") + e.what();
    ledger_.recordError(key, note);
    std::cerr << "[ExitStateMachine] " << key.toString() << " " << note << "\n";
  }

  cycle.deadline_ms = time_provider_.now_ms() + settings_.confirm_timeout_ms;
  ledger_.setExitState(key, domain::ExitState::WorkingExit, note);
  schedulePoll(key, settings_.confirm_poll_interval_ms);
  return {true, domain::ExitState::WorkingExit, note};
}

// -----------------------------------------------------------------------------
// handleRejectedExit: re-query, then apply the configured policy
// -----------------------------------------------------------------------------
domain::CommandResult ExitStateMachine::handleRejectedExit(
    const domain::PositionKey& key, const std::string& reason) {
  const std::string message = "exit order rejected: " + reason;
  std::cerr << "[ExitStateMachine] " << key.toString() << " " << message
            << "\n";
  ledger_.recordError(key, message);

  std::optional<BrokerPosition> broker;
  try {
    broker = gateway_.queryPosition(key.account_id, key.symbol);
  } catch (const TransientBrokerError& e) {
    std::cerr << "[ExitStateMachine] re-query after rejection failed: "
              << e.what() << "\n";
  }

  if (broker && broker->quantity == 0) {
    try {
      ledger_.verifyAgainstBroker(key, 0);
    } catch (const DriftDetectedError&) {
      reconciler_.correctToBroker(key, *broker, "exit rejected, broker flat");
    }
    finalize(key, "exit rejected but broker flat");
    return {true, state(key), message + "; broker flat"};
  }

  ExitCycle& cycle = cycles_[key];
  switch (settings_.rejected_exit_policy) {
    case RejectedExitPolicy::RetryOnce:
      if (!cycle.retried && broker) {
        cycle.retried = true;
        cycle.generation = next_generation_++;
        std::cout << "[ExitStateMachine] retrying exit once for "
                  << key.toString() << "\n";
        return submitExit(key, broker->quantity);
      }
      break;
    case RejectedExitPolicy::EscalateToKillSwitch:
      alert(key, AlertEvent::Severity::Warning, message + "; kill switch");
      return kill_switch_.activate(key, message);
    case RejectedExitPolicy::RequireManualClear:
      break;
  }

  // Protective orders stay cancelled. The position is left for an operator.
  ledger_.setExitState(key, domain::ExitState::Idle, message);
  ledger_.setNeedsAttention(key, true);
  alert(key, AlertEvent::Severity::Warning,
        message + "; broker still holds a position, needs attention");
  return {false, domain::ExitState::Idle, message};
}

void ExitStateMachine::finalize(const domain::PositionKey& key,
                                const std::string& reason) {
  const domain::Position position = ledger_.currentPosition(key);
  if (!position.isFlat()) {
    // Broker is flat but the correction could not be booked.
    ledger_.setNeedsAttention(key, true);
    alert(key, AlertEvent::Severity::Warning,
          "broker flat but ledger still holds " +
              std::to_string(position.quantity));
  }
  ledger_.setExitState(key, domain::ExitState::Idle, reason);
  cycles_.erase(key);
}

void ExitStateMachine::schedulePoll(const domain::PositionKey& key,
                                    std::int64_t delay_ms) {
  auto it = cycles_.find(key);
  if (it == cycles_.end()) {
    return;
  }
  EventSink post = post_;
  const std::uint64_t generation = it->second.generation;
  scheduler_.scheduleAfter(delay_ms, [post, key, generation] {
    post(ConfirmPollEvent{key, generation});
  });
}

// -----------------------------------------------------------------------------
// onConfirmPoll: one step of the confirmation loop
// -----------------------------------------------------------------------------
void ExitStateMachine::onConfirmPoll(const ConfirmPollEvent& event) {
  auto it = cycles_.find(event.key);
  if (it == cycles_.end() || it->second.generation != event.generation) {
    return;
  }
  if (kill_switch_.isActive(event.key)) {
    return;
  }
  const domain::Position position = ledger_.currentPosition(event.key);
  if (position.exit_state != domain::ExitState::WorkingExit &&
      position.exit_state != domain::ExitState::ConfirmFlat) {
    return;
  }

  const ExitCycle cycle = it->second;
  const bool past_deadline = time_provider_.now_ms() >= cycle.deadline_ms;

  std::optional<BrokerPosition> broker;
  try {
    broker = gateway_.queryPositionOnce(event.key.account_id, event.key.symbol);
  } catch (const TransientBrokerError& e) {
    std::cerr << "[ExitStateMachine] confirm poll for "
              << event.key.toString() << " failed: " << e.what() << "\n";
  }

  if (broker && broker->quantity == 0) {
    if (position.isFlat()) {
      finalize(event.key, "broker confirmed flat");
      return;
    }
    const bool exit_working =
        !cycle.exit_order_id.empty() &&
        tracker_.find(cycle.exit_order_id).has_value();
    if (!exit_working || past_deadline) {
      reconciler_.correctToBroker(event.key, *broker,
                                  "exit confirmed by broker, fill missing");
      finalize(event.key, "broker confirmed flat");
      return;
    }
  } else if (past_deadline) {
    std::ostringstream text;
    text << "exit not confirmed within " << settings_.confirm_timeout_ms
         << " ms (broker qty "
         << (broker ? std::to_string(broker->quantity) : std::string("unknown"))
         << ")";
    const TimeoutError timeout(text.str());
    alert(event.key, AlertEvent::Severity::Warning,
          std::string(timeout.what()) + "; kill switch");
    kill_switch_.activate(event.key, timeout.what());
    return;
  }

  schedulePoll(event.key, settings_.confirm_poll_interval_ms);
}

// -----------------------------------------------------------------------------
// onPositionChanged: exit fill → CONFIRM_FLAT
// -----------------------------------------------------------------------------
void ExitStateMachine::onPositionChanged(const PositionChangedEvent& event) {
  const domain::Position& position = event.position;
  if (position.exit_state != domain::ExitState::WorkingExit ||
      !position.isFlat()) {
    return;
  }
  auto it = cycles_.find(position.key());
  if (it == cycles_.end()) {
    return;
  }
  if (ledger_.setExitState(position.key(), domain::ExitState::ConfirmFlat,
                           "exit fill received")) {
    post_(ConfirmPollEvent{position.key(), it->second.generation});
  }
}

void ExitStateMachine::onOrderRejected(const OrderRejectedEvent& event) {
  for (auto& [key, cycle] : cycles_) {
    if (cycle.exit_order_id.empty() || cycle.exit_order_id != event.order_id) {
      continue;
    }
    const domain::ExitState current = state(key);
    if (current != domain::ExitState::WorkingExit ||
        kill_switch_.isActive(key)) {
      return;
    }
    const domain::PositionKey rejected_key = key;
    cycle.exit_order_id.clear();
    handleRejectedExit(rejected_key, event.reason);
    return;
  }
}

void ExitStateMachine::onExitStateChanged(const ExitStateChangedEvent& event) {
  if (event.to == domain::ExitState::Idle) {
    cycles_.erase(event.key);
  }
}

// -----------------------------------------------------------------------------
// onTick: stop-loss and take-profit pass-through triggers
// -----------------------------------------------------------------------------
void ExitStateMachine::onTick(const PriceTickEvent& event) {
  for (const domain::Position& position : ledger_.snapshots()) {
    if (position.symbol != event.symbol || position.isFlat()) {
      continue;
    }
    if (position.exit_state != domain::ExitState::Idle || position.halted ||
        position.needs_attention) {
      continue;
    }
    const domain::PositionKey key = position.key();
    const bool is_long = position.quantity > 0;

    std::optional<double> stop = dca_.stopLossPrice(key);
    if (stop && (is_long ? event.price <= *stop : event.price >= *stop)) {
      requestExit(key, "stop loss " + std::to_string(*stop) + " touched at " +
                           std::to_string(event.price));
      continue;
    }

    // A resting take-profit normally closes the position. Price trading
    // through the level without that fill means the limit was stranded.
    std::optional<double> target = dca_.takeProfitPrice(key);
    if (target && (is_long ? event.price > *target : event.price < *target)) {
      requestExit(key, "price " + std::to_string(event.price) +
                           " passed take profit " + std::to_string(*target));
    }
  }
}

void ExitStateMachine::alert(const domain::PositionKey& key,
                             AlertEvent::Severity severity,
                             const std::string& message) {
  std::cerr << "[ExitStateMachine] WARNING: " << key.toString() << " "
            << message << "\n";
  ledger_.recordError(key, message);

  AlertEvent event;
  event.key = key;
  event.severity = severity;
  event.source = "ExitStateMachine";
  event.message = message;
  event.timestamp = ms_to_timestamp(time_provider_.now_ms());
  bus_.publish(event);
}

}  // namespace flatguard
