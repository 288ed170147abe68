#include "flatguard/ledger/position_ledger.hpp"
#include "flatguard/domain/errors.hpp"
#include "flatguard/events/engine_events.hpp"
#include "flatguard/pnl/pnl_math.hpp"
#include "flatguard/time/time_utils.hpp"

#include <cstdlib>
#include <iostream>

namespace flatguard {

// -----------------------------------------------------------------------------
// Constructor: subscribe to the broker fill stream
// -----------------------------------------------------------------------------
PositionLedger::PositionLedger(EventBus& bus, IStateStore& store,
                               const domain::InstrumentTable& instruments,
                               const OrderTracker& tracker,
                               const ITimeProvider& time_provider)
    : bus_(bus),
      store_(store),
      instruments_(instruments),
      tracker_(tracker),
      time_provider_(time_provider),
      subscriptions_(bus) {
  subscriptions_.add<BrokerFillEvent>(
      [this](const BrokerFillEvent& e) { onBrokerFill(e); });
}

// -----------------------------------------------------------------------------
// template mutate: copy, modify, persist, commit
// -----------------------------------------------------------------------------
template <typename Fn>
domain::Position PositionLedger::mutate(const domain::PositionKey& key, Fn fn) {
  domain::Position row = rowOrFlat(key);
  fn(row);
  store_.savePosition(row);
  commit(row);
  return row;
}

domain::Position PositionLedger::rowOrFlat(
    const domain::PositionKey& key) const {
  std::shared_lock lock(positions_mutex_);
  auto it = positions_.find(key);
  if (it != positions_.end()) {
    return it->second;
  }
  domain::Position flat;
  flat.account_id = key.account_id;
  flat.symbol = key.symbol;
  return flat;
}

void PositionLedger::commit(const domain::Position& position) {
  std::unique_lock lock(positions_mutex_);
  positions_[position.key()] = position;
}

// -----------------------------------------------------------------------------
// recordFill: dedupe, guard, apply, persist, publish
// -----------------------------------------------------------------------------
std::optional<domain::Position> PositionLedger::recordFill(
    const domain::Fill& incoming) {
  const domain::PositionKey key = incoming.key();

  auto seen_it = seen_fill_ids_.find(key);
  if (seen_it == seen_fill_ids_.end()) {
    std::unordered_set<std::string> ids;
    for (const domain::Fill& f : store_.loadFills(key)) {
      ids.insert(f.fill_id);
    }
    seen_it = seen_fill_ids_.emplace(key, std::move(ids)).first;
  }
  std::unordered_set<std::string>& seen = seen_it->second;

  if (!incoming.fill_id.empty() && seen.count(incoming.fill_id) > 0) {
    std::cout << "[PositionLedger] duplicate fill " << incoming.fill_id
              << " for " << key.toString() << " ignored\n";
    return std::nullopt;
  }

  domain::Fill fill = incoming;
  fill.role = roleFor(incoming);

  const domain::Position before = rowOrFlat(key);
  domain::Position after = before;
  applyFill(after, fill, instruments_.lookup(key.symbol).multiplier);

  if (fill.role != domain::FillRole::Reconcile &&
      before.exit_state != domain::ExitState::Idle &&
      std::llabs(after.quantity) > std::llabs(before.quantity)) {
    throw ConflictingIntentError(
        "fill " + fill.fill_id + " would grow " + key.toString() + " from " +
        std::to_string(before.quantity) + " to " +
        std::to_string(after.quantity) + " during " +
        domain::toString(before.exit_state));
  }

  store_.appendFill(fill);
  store_.savePosition(after);

  if (!fill.fill_id.empty()) {
    seen.insert(fill.fill_id);
  }
  commit(after);

  std::cout << "[PositionLedger] " << key.toString() << " "
            << domain::toString(fill.role) << " "
            << domain::toString(fill.side) << " " << fill.quantity << " @ "
            << fill.price << " -> qty=" << after.quantity
            << " avg=" << after.average_entry_price
            << " realized=" << after.realized_pnl << "\n";

  PositionChangedEvent changed;
  changed.position = after;
  changed.fill = fill;
  changed.previous_exit_state = before.exit_state;
  changed.timestamp = ms_to_timestamp(time_provider_.now_ms());
  bus_.publish(changed);

  return after;
}

domain::Position PositionLedger::currentPosition(
    const domain::PositionKey& key) const {
  return rowOrFlat(key);
}

bool PositionLedger::contains(const domain::PositionKey& key) const {
  std::shared_lock lock(positions_mutex_);
  return positions_.count(key) > 0;
}

// -----------------------------------------------------------------------------
// rebuild: replay the stored fill log, keep controller state
// -----------------------------------------------------------------------------
domain::Position PositionLedger::rebuild(const domain::PositionKey& key) {
  const std::vector<domain::Fill> fills = store_.loadFills(key);
  const domain::Position replayed = replay(key, fills, instruments_);

  domain::Position row = mutate(key, [&](domain::Position& p) {
    const bool was_open = p.quantity != 0;
    p.side = replayed.side;
    p.quantity = replayed.quantity;
    p.average_entry_price = replayed.average_entry_price;
    p.realized_pnl = replayed.realized_pnl;
    p.opened_at_ms = replayed.opened_at_ms;
    p.closed_at_ms = replayed.closed_at_ms;
    p.fill_count = replayed.fill_count;
    if (p.quantity == 0) {
      p.unrealized_pnl = 0.0;
      p.dca_triggered_indices.clear();
      if (was_open && p.closed_at_ms == 0) {
        p.closed_at_ms = time_provider_.now_ms();
      }
    }
  });

  std::unordered_set<std::string>& seen = seen_fill_ids_[key];
  seen.clear();
  for (const domain::Fill& f : fills) {
    seen.insert(f.fill_id);
  }

  std::cout << "[PositionLedger] rebuilt " << key.toString() << " from "
            << fills.size() << " fill(s): qty=" << row.quantity
            << " avg=" << row.average_entry_price << "\n";

  PositionChangedEvent changed;
  changed.position = row;
  changed.previous_exit_state = row.exit_state;
  changed.timestamp = ms_to_timestamp(time_provider_.now_ms());
  bus_.publish(changed);
  return row;
}

// -----------------------------------------------------------------------------
// restore: startup recovery and corruption check
// -----------------------------------------------------------------------------
domain::Position PositionLedger::restore(const domain::Position& row) {
  const domain::PositionKey key = row.key();
  const std::vector<domain::Fill> fills = store_.loadFills(key);
  const domain::Position replayed = replay(key, fills, instruments_);

  std::unordered_set<std::string>& seen = seen_fill_ids_[key];
  seen.clear();
  for (const domain::Fill& f : fills) {
    seen.insert(f.fill_id);
  }

  domain::Position result = row;
  result.side = domain::positionSideFor(result.quantity);
  std::string corruption;

  if (replayed.fill_count > row.fill_count) {
    std::cout << "[PositionLedger] " << key.toString() << ": fill log is "
              << (replayed.fill_count - row.fill_count)
              << " fill(s) ahead of the stored row; replaying\n";
    result.side = replayed.side;
    result.quantity = replayed.quantity;
    result.average_entry_price = replayed.average_entry_price;
    result.realized_pnl = replayed.realized_pnl;
    result.opened_at_ms = replayed.opened_at_ms;
    result.closed_at_ms = replayed.closed_at_ms;
    result.fill_count = replayed.fill_count;
    if (result.quantity == 0) {
      result.dca_triggered_indices.clear();
    }
  } else if (replayed.fill_count < row.fill_count) {
    corruption = "fill log has " + std::to_string(replayed.fill_count) +
                 " fill(s), stored row counts " +
                 std::to_string(row.fill_count);
  } else if (replayed.quantity != row.quantity) {
    corruption = "fill log nets to " + std::to_string(replayed.quantity) +
                 ", stored row says " + std::to_string(row.quantity);
  }

  if (!corruption.empty()) {
    result.halted = true;
    result.last_error = "ledger corruption: " + corruption;
  }

  store_.savePosition(result);
  commit(result);

  if (!corruption.empty()) {
    std::cerr << "[PositionLedger] FATAL: " << key.toString() << " "
              << result.last_error << "; symbol halted\n";
    AlertEvent alert;
    alert.key = key;
    alert.severity = AlertEvent::Severity::Fatal;
    alert.source = "PositionLedger";
    alert.message = result.last_error;
    alert.timestamp = ms_to_timestamp(time_provider_.now_ms());
    bus_.publish(alert);
    throw LedgerCorruptionError(key.toString() + ": " + corruption);
  }
  return result;
}

// -----------------------------------------------------------------------------
// Controller-state setters
// -----------------------------------------------------------------------------
bool PositionLedger::setExitState(const domain::PositionKey& key,
                                  domain::ExitState next,
                                  const std::string& reason) {
  const domain::ExitState from = rowOrFlat(key).exit_state;
  if (from == next) {
    return false;
  }
  if (!domain::isLegalExitTransition(from, next)) {
    std::cerr << "[PositionLedger] WARNING: illegal exit transition "
              << domain::toString(from) << " -> " << domain::toString(next)
              << " for " << key.toString() << " (" << reason << ")\n";
    return false;
  }

  mutate(key, [&](domain::Position& p) {
    p.exit_state = next;
    p.last_transition = std::string(domain::toString(from)) + " -> " +
                        domain::toString(next) + ": " + reason;
  });

  std::cout << "[PositionLedger] " << key.toString() << " "
            << domain::toString(from) << " -> " << domain::toString(next)
            << " (" << reason << ")\n";

  ExitStateChangedEvent changed;
  changed.key = key;
  changed.from = from;
  changed.to = next;
  changed.reason = reason;
  changed.timestamp = ms_to_timestamp(time_provider_.now_ms());
  bus_.publish(changed);
  return true;
}

void PositionLedger::markDcaRungFired(const domain::PositionKey& key,
                                      int rung_index) {
  mutate(key, [&](domain::Position& p) {
    p.dca_triggered_indices.insert(rung_index);
  });
}

void PositionLedger::setHalted(const domain::PositionKey& key, bool halted,
                               const std::string& reason) {
  mutate(key, [&](domain::Position& p) {
    p.halted = halted;
    if (halted) {
      p.last_error = reason;
    }
  });
}

void PositionLedger::setNeedsAttention(const domain::PositionKey& key,
                                       bool needs_attention) {
  mutate(key, [&](domain::Position& p) { p.needs_attention = needs_attention; });
}

void PositionLedger::recordError(const domain::PositionKey& key,
                                 const std::string& error) {
  mutate(key, [&](domain::Position& p) { p.last_error = error; });
}

void PositionLedger::updateMarks(const domain::PositionKey& key,
                                 double unrealized, double worst, double best) {
  std::unique_lock lock(positions_mutex_);
  auto it = positions_.find(key);
  if (it == positions_.end()) {
    return;
  }
  it->second.unrealized_pnl = unrealized;
  it->second.worst_unrealized_pnl = worst;
  it->second.best_unrealized_pnl = best;
}

void PositionLedger::verifyAgainstBroker(const domain::PositionKey& key,
                                         std::int64_t broker_quantity) const {
  const std::int64_t virtual_quantity = rowOrFlat(key).quantity;
  if (virtual_quantity != broker_quantity) {
    throw DriftDetectedError(
        key.toString() + ": ledger " + std::to_string(virtual_quantity) +
            " vs broker " + std::to_string(broker_quantity),
        virtual_quantity, broker_quantity);
  }
}

std::vector<domain::Position> PositionLedger::snapshots() const {
  std::shared_lock lock(positions_mutex_);
  std::vector<domain::Position> result;
  result.reserve(positions_.size());
  for (const auto& [key, position] : positions_) {
    result.push_back(position);
  }
  return result;
}

std::vector<domain::PositionKey> PositionLedger::keys() const {
  std::shared_lock lock(positions_mutex_);
  std::vector<domain::PositionKey> result;
  result.reserve(positions_.size());
  for (const auto& [key, position] : positions_) {
    result.push_back(key);
  }
  return result;
}

// -----------------------------------------------------------------------------
// applyFill: fill math plus lifecycle bookkeeping
// -----------------------------------------------------------------------------
void PositionLedger::applyFill(domain::Position& position,
                               const domain::Fill& fill, double multiplier) {
  const std::int64_t before = position.quantity;

  const pnl::FillEffect effect =
      pnl::applySignedFill(before, position.average_entry_price,
                           fill.signedQuantity(), fill.price, multiplier);

  position.quantity = effect.quantity;
  position.average_entry_price = effect.average_price;
  position.realized_pnl += effect.realized_pnl;
  position.side = domain::positionSideFor(position.quantity);
  ++position.fill_count;

  const bool opened = position.quantity != 0 &&
                      (before == 0 || (before > 0) != (position.quantity > 0));
  if (opened) {
    position.opened_at_ms = fill.timestamp_ms;
    position.closed_at_ms = 0;
    position.unrealized_pnl = 0.0;
    position.worst_unrealized_pnl = 0.0;
    position.best_unrealized_pnl = 0.0;
    position.dca_triggered_indices.clear();
  }

  if (before != 0 && position.quantity == 0) {
    position.closed_at_ms = fill.timestamp_ms;
    position.unrealized_pnl = 0.0;
    position.dca_triggered_indices.clear();
  }
}

domain::Position PositionLedger::replay(
    const domain::PositionKey& key, const std::vector<domain::Fill>& fills,
    const domain::InstrumentTable& instruments) {
  domain::Position position;
  position.account_id = key.account_id;
  position.symbol = key.symbol;

  const double multiplier = instruments.lookup(key.symbol).multiplier;
  std::unordered_set<std::string> applied;
  for (const domain::Fill& fill : fills) {
    if (!fill.fill_id.empty() && !applied.insert(fill.fill_id).second) {
      continue;
    }
    applyFill(position, fill, multiplier);
  }
  return position;
}

// -----------------------------------------------------------------------------
// onBrokerFill: book pushed fills, surface failures
// -----------------------------------------------------------------------------
void PositionLedger::onBrokerFill(const BrokerFillEvent& event) {
  const domain::PositionKey key = event.fill.key();
  AlertEvent alert;
  alert.key = key;
  alert.source = "PositionLedger";

  try {
    recordFill(event.fill);
    return;
  } catch (const ConflictingIntentError& e) {
    std::cerr << "[PositionLedger] WARNING: " << e.what() << "\n";
    alert.severity = AlertEvent::Severity::Warning;
    alert.message = e.what();
    recordError(key, e.what());
  } catch (const StateStoreError& e) {
    std::cerr << "[PositionLedger] FATAL: fill " << event.fill.fill_id
              << " not persisted: " << e.what() << "\n";
    alert.severity = AlertEvent::Severity::Fatal;
    alert.message = std::string("fill not persisted: ") + e.what();
  }

  alert.timestamp = ms_to_timestamp(time_provider_.now_ms());
  bus_.publish(alert);
}

domain::FillRole PositionLedger::roleFor(const domain::Fill& fill) const {
  if (fill.role == domain::FillRole::Reconcile) {
    return fill.role;
  }
  std::optional<domain::OrderPurpose> purpose = tracker_.purposeOf(fill.order_id);
  if (!purpose) {
    return fill.role;
  }
  switch (*purpose) {
    case domain::OrderPurpose::Entry:
      return domain::FillRole::Entry;
    case domain::OrderPurpose::DcaEntry:
      return domain::FillRole::Dca;
    case domain::OrderPurpose::TakeProfit:
    case domain::OrderPurpose::StopLoss:
    case domain::OrderPurpose::Exit:
      return domain::FillRole::Exit;
  }
  return fill.role;
}

}  // namespace flatguard
