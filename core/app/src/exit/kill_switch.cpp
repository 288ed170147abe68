#include "flatguard/exit/kill_switch.hpp"
#include "flatguard/domain/errors.hpp"
#include "flatguard/events/engine_events.hpp"
#include "flatguard/time/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace flatguard {

namespace {

using SteadyClock = std::chrono::steady_clock;

std::int64_t elapsedMs(SteadyClock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             SteadyClock::now() - since)
      .count();
}

struct LaneRequest {
  domain::PositionKey key;
  std::uint64_t generation{0};
  std::int64_t ledger_quantity{0};
  SteadyClock::time_point started;
  SteadyClock::time_point deadline;
  std::chrono::milliseconds interval{0};
};

// Polls until the broker reports flat. Throws TimeoutError at the deadline
// or as soon as the activation expires.
void waitForBrokerFlat(BrokerGateway& gateway, const LaneRequest& request,
                       const std::atomic<bool>& expired,
                       std::int64_t& last_quantity) {
  const domain::PositionKey& key = request.key;
  while (true) {
    try {
      last_quantity =
          gateway.queryPositionOnce(key.account_id, key.symbol).quantity;
      if (last_quantity == 0) {
        return;
      }
    } catch (const TransientBrokerError& e) {
      std::cerr << "[KillSwitch] poll of " << key.toString()
                << " failed: " << e.what() << "\n";
    }
    if (expired.load()) {
      throw TimeoutError("activation expired with broker at " +
                         std::to_string(last_quantity));
    }
    if (SteadyClock::now() + request.interval > request.deadline) {
      throw TimeoutError("broker still reports " +
                         std::to_string(last_quantity) + " at deadline");
    }
    std::this_thread::sleep_for(request.interval);
  }
}

// Body of one flatten lane: size, send, poll, report.
void runFlattenLane(BrokerGateway& gateway, const EventSink& post,
                    const LaneRequest& request,
                    const std::atomic<bool>& expired) {
  const domain::PositionKey& key = request.key;
  KillSwitchReportEvent report;
  report.key = key;
  report.generation = request.generation;

  std::int64_t quantity = request.ledger_quantity;
  try {
    quantity = gateway.queryPositionOnce(key.account_id, key.symbol).quantity;
  } catch (const TransientBrokerError& e) {
    std::cerr << "[KillSwitch] position query failed, flattening ledger "
              << "quantity " << request.ledger_quantity << ": " << e.what()
              << "\n";
  }

  try {
    if (quantity != 0) {
      if (expired.load() || SteadyClock::now() >= request.deadline) {
        throw TimeoutError("activation expired before the flatten was sent");
      }
      const domain::OrderIntent intent = domain::OrderIntent::exit(
          key, domain::closingSide(quantity), std::llabs(quantity));
      report.flatten_order_id = gateway.placeOrder(intent);
      report.flatten_intent = intent;

      KillSwitchReportEvent placed = report;
      placed.finished = false;
      post(placed);
    }
    waitForBrokerFlat(gateway, request, expired, quantity);
    report.broker_flat = true;
  } catch (const FlatguardError& e) {
    report.error = e.what();
  }

  report.broker_quantity = quantity;
  report.elapsed_ms = elapsedMs(request.started);
  post(report);
}

}  // namespace

KillSwitch::KillSwitch(EventBus& bus, PositionLedger& ledger,
                       OrderTracker& tracker, BrokerGateway& gateway,
                       DriftReconciler& reconciler, WorkerPool& workers,
                       IScheduler& scheduler, EventSink post,
                       const ITimeProvider& time_provider,
                       KillSwitchSettings settings)
    : bus_(bus),
      ledger_(ledger),
      tracker_(tracker),
      gateway_(gateway),
      reconciler_(reconciler),
      workers_(workers),
      scheduler_(scheduler),
      post_(std::move(post)),
      time_provider_(time_provider),
      settings_(settings),
      subscriptions_(bus) {
  subscriptions_.add<KillSwitchReportEvent>(
      [this](const KillSwitchReportEvent& e) { onReport(e); });
  subscriptions_.add<BrokerFillEvent>(
      [this](const BrokerFillEvent& e) { onFill(e); });
  subscriptions_.add<KillSwitchDeadlineEvent>(
      [this](const KillSwitchDeadlineEvent& e) { onDeadline(e); });
}

KillSwitch::~KillSwitch() {
  for (auto& [key, activation] : active_) {
    activation.expired->store(true);
  }
  for (Lane& lane : lanes_) {
    if (lane.thread.joinable()) {
      lane.thread.join();
    }
  }
}

bool KillSwitch::isActive(const domain::PositionKey& key) const {
  return active_.count(key) > 0;
}

void KillSwitch::reapLanes() {
  auto it = lanes_.begin();
  while (it != lanes_.end()) {
    if (it->done->load()) {
      it->thread.join();
      it = lanes_.erase(it);
    } else {
      ++it;
    }
  }
}

// -----------------------------------------------------------------------------
// activate: cancels on the pool, flatten on its own lane, safety net
// -----------------------------------------------------------------------------
domain::CommandResult KillSwitch::activate(const domain::PositionKey& key,
                                           const std::string& reason) {
  const domain::Position position = ledger_.currentPosition(key);

  if (isActive(key)) {
    return {false, position.exit_state, "kill switch already active"};
  }
  if (position.isFlat() && position.exit_state == domain::ExitState::Idle) {
    return {false, domain::ExitState::Idle, "already flat"};
  }

  const std::uint64_t generation = next_generation_++;
  const Flag expired = std::make_shared<std::atomic<bool>>(false);
  Activation& activation = active_[key];
  activation = Activation{};
  activation.generation = generation;
  activation.started_at_ms = time_provider_.now_ms();
  activation.reason = reason;
  activation.expired = expired;
  ledger_.setExitState(key, domain::ExitState::ConfirmFlat,
                       "kill switch: " + reason);

  std::cerr << "[KillSwitch] ACTIVATED for " << key.toString() << " ("
            << reason << "), ledger qty " << position.quantity << "\n";

  LaneRequest request;
  request.key = key;
  request.generation = generation;
  request.ledger_quantity = position.quantity;
  request.started = SteadyClock::now();
  request.deadline =
      request.started + std::chrono::milliseconds(settings_.deadline_ms);
  request.interval = std::chrono::milliseconds(settings_.poll_interval_ms);

  const std::vector<domain::BrokerOrderId> local_orders =
      tracker_.workingOrders(key);
  for (const domain::BrokerOrderId& id : local_orders) {
    tracker_.markCanceled(id);
  }

  BrokerGateway& gateway = gateway_;
  EventSink post = post_;

  workers_.submit([&gateway, key, local_orders] {
    std::vector<domain::BrokerOrderId> ids = local_orders;
    try {
      for (const domain::BrokerOrderId& id :
           gateway.queryOrdersOnce(key.account_id, key.symbol)) {
        if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
          ids.push_back(id);
        }
      }
    } catch (const FlatguardError& e) {
      std::cerr << "[KillSwitch] order list for " << key.toString()
                << " unavailable: " << e.what() << "\n";
    }
    for (const domain::BrokerOrderId& id : ids) {
      try {
        gateway.cancelOrder(key.account_id, id);
      } catch (const NotFoundError&) {
        // Already filled or cancelled.
      } catch (const FlatguardError& e) {
        std::cerr << "[KillSwitch] cancel " << id << " failed: " << e.what()
                  << "\n";
      }
    }
  });

  scheduler_.scheduleAfter(
      settings_.deadline_ms + settings_.report_grace_ms,
      [post, key, generation] { post(KillSwitchDeadlineEvent{key, generation}); });

  reapLanes();
  const Flag done = std::make_shared<std::atomic<bool>>(false);
  try {
    std::thread lane([&gateway, post, request, expired, done] {
      runFlattenLane(gateway, post, request, *expired);
      done->store(true);
    });
    lanes_.push_back(Lane{std::move(lane), done});
  } catch (const std::system_error& e) {
    std::cerr << "[KillSwitch] no flatten lane for " << key.toString() << " ("
              << e.what() << "); queueing on the worker pool\n";
    workers_.submit([&gateway, post, request, expired] {
      runFlattenLane(gateway, post, request, *expired);
    });
  }

  return {true, domain::ExitState::ConfirmFlat, "flatten issued"};
}

// -----------------------------------------------------------------------------
// onReport: track the flatten, then settle the ledger or halt
// -----------------------------------------------------------------------------
void KillSwitch::onReport(const KillSwitchReportEvent& event) {
  auto it = active_.find(event.key);
  if (it == active_.end() || it->second.generation != event.generation) {
    return;
  }
  Activation& activation = it->second;

  if (!event.finished) {
    activation.flatten_order_id = event.flatten_order_id;
    tracker_.track(event.flatten_order_id, event.flatten_intent,
                   time_provider_.now_ms());
    return;
  }

  if (!event.broker_flat) {
    fail(event.key, "not flat after " + std::to_string(event.elapsed_ms) +
                        " ms (broker qty " +
                        std::to_string(event.broker_quantity) + "): " +
                        event.error);
    return;
  }

  try {
    ledger_.verifyAgainstBroker(event.key, 0);
  } catch (const DriftDetectedError& e) {
    if (!activation.flatten_order_id.empty() &&
        tracker_.find(activation.flatten_order_id)) {
      activation.awaiting_fill = true;
      std::cout << "[KillSwitch] " << event.key.toString()
                << " flat at broker; waiting for the fill of "
                << activation.flatten_order_id << "\n";
      return;
    }
    std::cerr << "[KillSwitch] " << e.what() << "; correcting to broker\n";
    BrokerPosition flat;
    reconciler_.correctToBroker(event.key, flat, "kill switch flatten");
  }

  settle(event.key,
         "broker flat in " + std::to_string(event.elapsed_ms) + " ms" +
             (event.flatten_order_id.empty()
                  ? std::string(" (no order needed)")
                  : " via " + event.flatten_order_id));
}

// Runs after PositionLedger has booked the fill.
void KillSwitch::onFill(const BrokerFillEvent& event) {
  const domain::PositionKey key = event.fill.key();
  auto it = active_.find(key);
  if (it == active_.end() || !it->second.awaiting_fill) {
    return;
  }
  if (ledger_.currentPosition(key).isFlat()) {
    settle(key, "flatten fill booked");
    return;
  }
  if (!tracker_.find(it->second.flatten_order_id)) {
    BrokerPosition flat;
    reconciler_.correctToBroker(key, flat, "kill switch flatten");
    settle(key, "flatten filled, ledger corrected to broker");
  }
}

void KillSwitch::onDeadline(const KillSwitchDeadlineEvent& event) {
  auto it = active_.find(event.key);
  if (it == active_.end() || it->second.generation != event.generation) {
    return;
  }
  if (it->second.awaiting_fill) {
    std::cerr << "[KillSwitch] fill of " << it->second.flatten_order_id
              << " not booked by the deadline; correcting to broker\n";
    BrokerPosition flat;
    reconciler_.correctToBroker(event.key, flat, "kill switch flatten");
    settle(event.key, "broker flat, flatten fill missing at deadline");
    return;
  }
  fail(event.key, "no flatten report within " +
                      std::to_string(settings_.deadline_ms) + " ms deadline");
}

void KillSwitch::settle(const domain::PositionKey& key,
                        const std::string& note) {
  active_.erase(key);
  ledger_.setExitState(key, domain::ExitState::Idle, "kill switch: " + note);
  std::cout << "[KillSwitch] " << key.toString() << " " << note << "\n";
}

void KillSwitch::fail(const domain::PositionKey& key,
                      const std::string& message) {
  auto it = active_.find(key);
  if (it != active_.end()) {
    it->second.expired->store(true);
    active_.erase(it);
  }
  const std::string text = "kill switch failed: " + message;
  std::cerr << "[KillSwitch] FATAL: " << key.toString() << " " << text
            << "; symbol halted, operator reset required\n";

  ledger_.setHalted(key, true, text);

  AlertEvent alert;
  alert.key = key;
  alert.severity = AlertEvent::Severity::Fatal;
  alert.source = "KillSwitch";
  alert.message = text;
  alert.timestamp = ms_to_timestamp(time_provider_.now_ms());
  bus_.publish(alert);
}

}  // namespace flatguard
