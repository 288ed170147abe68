#include "flatguard/reconcile/drift_reconciler.hpp"
#include "flatguard/domain/errors.hpp"
#include "flatguard/events/engine_events.hpp"
#include "flatguard/time/time_utils.hpp"

#include <cstdlib>
#include <iostream>
#include <unordered_map>

namespace flatguard {

DriftReconciler::DriftReconciler(EventBus& bus, PositionLedger& ledger,
                                 const OrderTracker& tracker,
                                 BrokerGateway& gateway, IStateStore& store,
                                 const PriceFeed& feed,
                                 const ITimeProvider& time_provider,
                                 OrderIdGenerator& drift_ids,
                                 ReconcileSettings settings)
    : bus_(bus),
      ledger_(ledger),
      tracker_(tracker),
      gateway_(gateway),
      store_(store),
      feed_(feed),
      time_provider_(time_provider),
      drift_ids_(drift_ids),
      settings_(settings),
      subscriptions_(bus) {
  subscriptions_.add<ReconcileTimerEvent>(
      [this](const ReconcileTimerEvent& e) { onTimer(e); });
  subscriptions_.add<PositionSnapshotEvent>(
      [this](const PositionSnapshotEvent& e) { onSnapshot(e); });
}

bool DriftReconciler::shouldDefer(const domain::Position& position) const {
  return position.exit_state != domain::ExitState::Idle || position.halted ||
         tracker_.hasPendingMarketOrders(position.key(),
                                         time_provider_.now_ms(),
                                         settings_.pending_order_grace_ms);
}

// -----------------------------------------------------------------------------
// reconcile: detect, record, correct
// -----------------------------------------------------------------------------
std::optional<domain::DriftRecord> DriftReconciler::reconcile(
    const domain::PositionKey& key, const BrokerPosition& broker, bool force,
    const std::string& reason) {
  const domain::Position position = ledger_.currentPosition(key);
  if (!force && shouldDefer(position)) {
    return std::nullopt;
  }
  if (position.quantity == broker.quantity) {
    return std::nullopt;
  }

  domain::DriftRecord record;
  record.id = drift_ids_.next_id();
  record.account_id = key.account_id;
  record.symbol = key.symbol;
  record.virtual_quantity = position.quantity;
  record.broker_quantity = broker.quantity;
  record.detected_at_ms = time_provider_.now_ms();
  record.resolution = domain::DriftResolution::Pending;
  record.note = reason;

  std::cerr << "[DriftReconciler] WARNING: drift on " << key.toString()
            << ": ledger " << position.quantity << " vs broker "
            << broker.quantity
            << (reason.empty() ? std::string() : " (" + reason + ")") << "\n";

  store_.appendDrift(record);
  publish(record);

  try {
    if (rebuildFromBrokerFills(key, broker.quantity)) {
      record.resolution = domain::DriftResolution::RebuiltFromBrokerFills;
    } else {
      bookCorrection(position, broker, record.id);
      record.resolution = domain::DriftResolution::CorrectedToBroker;
    }
  } catch (const FlatguardError& e) {
    record.resolution = domain::DriftResolution::Unresolved;
    record.note += record.note.empty() ? "" : "; ";
    record.note += e.what();
    std::cerr << "[DriftReconciler] correction of " << key.toString()
              << " failed: " << e.what() << "\n";
  }

  record.resolved_at_ms = time_provider_.now_ms();
  store_.appendDrift(record);
  publish(record);

  std::cout << "[DriftReconciler] " << key.toString() << " drift #"
            << record.id << " " << domain::toString(record.resolution)
            << "; ledger now " << ledger_.currentPosition(key).quantity
            << "\n";

  AlertEvent alert;
  alert.key = key;
  alert.severity = AlertEvent::Severity::Warning;
  alert.source = "DriftReconciler";
  alert.message = "drift " + std::to_string(position.quantity) + " vs " +
                  std::to_string(broker.quantity) + ": " +
                  domain::toString(record.resolution);
  alert.timestamp = ms_to_timestamp(time_provider_.now_ms());
  bus_.publish(alert);

  if (record.resolution == domain::DriftResolution::Unresolved) {
    ledger_.recordError(key, "drift unresolved: " + record.note);
  }
  return record;
}

std::optional<domain::DriftRecord> DriftReconciler::correctToBroker(
    const domain::PositionKey& key, const BrokerPosition& broker,
    const std::string& reason) {
  return reconcile(key, broker, true, reason);
}

std::optional<domain::DriftRecord> DriftReconciler::reconcileKey(
    const domain::PositionKey& key, bool force) {
  if (!force && shouldDefer(ledger_.currentPosition(key))) {
    return std::nullopt;
  }
  BrokerPosition broker;
  try {
    broker = gateway_.queryPosition(key.account_id, key.symbol);
  } catch (const TransientBrokerError& e) {
    std::cerr << "[DriftReconciler] " << key.toString()
              << " skipped, broker unavailable: " << e.what() << "\n";
    return std::nullopt;
  }
  return reconcile(key, broker, force, force ? "operator" : "");
}

void DriftReconciler::sweep() {
  for (const domain::PositionKey& key : ledger_.keys()) {
    reconcileKey(key, false);
  }
}

std::vector<domain::DriftRecord> DriftReconciler::driftRecords(
    const domain::PositionKey& key) const {
  return store_.loadDrifts(key);
}

void DriftReconciler::onTimer(const ReconcileTimerEvent&) { sweep(); }

void DriftReconciler::onSnapshot(const PositionSnapshotEvent& event) {
  BrokerPosition broker;
  broker.quantity = event.quantity;
  broker.side = domain::positionSideFor(event.quantity);
  broker.average_price = event.average_price;
  reconcile(domain::PositionKey{event.account_id, event.symbol}, broker);
}

// -----------------------------------------------------------------------------
// rebuildFromBrokerFills: adopt the broker's history when it adds up
// -----------------------------------------------------------------------------
bool DriftReconciler::rebuildFromBrokerFills(const domain::PositionKey& key,
                                             std::int64_t broker_quantity) {
  std::vector<domain::Fill> history;
  try {
    history = gateway_.queryFills(key.account_id, key.symbol);
  } catch (const TransientBrokerError& e) {
    std::cerr << "[DriftReconciler] fill history for " << key.toString()
              << " unavailable: " << e.what() << "\n";
    return false;
  }
  if (history.empty()) {
    return false;
  }

  std::int64_t net = 0;
  for (const domain::Fill& fill : history) {
    net += fill.signedQuantity();
  }
  if (net != broker_quantity) {
    std::cerr << "[DriftReconciler] broker fill history for " << key.toString()
              << " nets to " << net << ", not " << broker_quantity << "\n";
    return false;
  }

  std::unordered_map<std::string, domain::FillRole> local_roles;
  for (const domain::Fill& fill : store_.loadFills(key)) {
    local_roles[fill.fill_id] = fill.role;
  }
  for (domain::Fill& fill : history) {
    auto it = local_roles.find(fill.fill_id);
    if (it != local_roles.end()) {
      fill.role = it->second;
    }
  }

  store_.replaceFills(key, history);
  ledger_.rebuild(key);
  return true;
}

// -----------------------------------------------------------------------------
// bookCorrection: reconcile-role fills that move the ledger to the broker
// -----------------------------------------------------------------------------
void DriftReconciler::bookCorrection(const domain::Position& position,
                                     const BrokerPosition& broker,
                                     std::uint64_t drift_id) {
  const domain::PositionKey key = position.key();
  const std::int64_t now = time_provider_.now_ms();
  const double mark = feed_.lastPrice(key.symbol).value_or(
      position.average_entry_price > 0.0 ? position.average_entry_price
                                         : broker.average_price);
  int sequence = 0;

  auto book = [&](std::int64_t signed_quantity, double price) {
    domain::Fill fill;
    fill.fill_id = "RECON-" + std::to_string(drift_id) + "-" +
                   std::to_string(++sequence);
    fill.account_id = key.account_id;
    fill.symbol = key.symbol;
    fill.side = signed_quantity > 0 ? domain::Side::Buy : domain::Side::Sell;
    fill.quantity = std::llabs(signed_quantity);
    fill.price = price;
    fill.timestamp_ms = now;
    fill.role = domain::FillRole::Reconcile;
    ledger_.recordFill(fill);
  };

  if (broker.quantity == 0) {
    book(-position.quantity, mark);
    return;
  }
  if (broker.average_price > 0.0) {
    if (position.quantity != 0) {
      book(-position.quantity, position.average_entry_price);
    }
    book(broker.quantity, broker.average_price);
    return;
  }
  book(broker.quantity - position.quantity, mark);
}

void DriftReconciler::publish(const domain::DriftRecord& record) {
  DriftDetectedEvent event;
  event.record = record;
  event.timestamp = ms_to_timestamp(time_provider_.now_ms());
  bus_.publish(event);
}

}  // namespace flatguard
