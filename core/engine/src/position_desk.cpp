#include "flatguard/engine/position_desk.hpp"
#include "flatguard/domain/errors.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace flatguard {

namespace {

// Runs fn and settles the reply with its result or its exception.
template <typename Fn>
void answer(const CommandReply& reply, Fn fn) {
  try {
    domain::CommandResult result = fn();
    if (reply) {
      reply->set_value(std::move(result));
    }
  } catch (const std::exception& e) {
    std::cerr << "[PositionDesk] command failed: " << e.what() << "\n";
    if (reply) {
      reply->set_exception(std::current_exception());
    }
  }
}

}  // namespace

PositionDesk::PositionDesk(EventLoopThread& loop, DeskResources resources,
                           const EngineConfig& config)
    : bus_(loop.eventBus()),
      resources_(resources),
      tracker_(bus_),
      ledger_(bus_, resources.store, resources.instruments, tracker_,
              resources.time_provider),
      pnl_(bus_, ledger_, resources.feed, resources.instruments),
      dca_(bus_, ledger_, tracker_, resources.gateway, resources.store,
           resources.feed, resources.instruments, resources.time_provider,
           config.dca_defaults),
      reconciler_(bus_, ledger_, tracker_, resources.gateway, resources.store,
                  resources.feed, resources.time_provider, resources.drift_ids,
                  config.reconcile),
      kill_switch_(bus_, ledger_, tracker_, resources.gateway, reconciler_,
                   resources.workers, resources.scheduler,
                   [&loop](Event e) { loop.push(std::move(e)); },
                   resources.time_provider, config.kill_switch),
      exits_(bus_, ledger_, tracker_, resources.gateway, dca_, reconciler_,
             kill_switch_, resources.scheduler,
             [&loop](Event e) { loop.push(std::move(e)); },
             resources.time_provider, config.exit),
      subscriptions_(bus_) {
  subscriptions_.add<OpenPositionCommand>(
      [this](const OpenPositionCommand& c) { onOpen(c); });
  subscriptions_.add<ExitCommand>([this](const ExitCommand& c) { onExit(c); });
  subscriptions_.add<ForceFlattenCommand>(
      [this](const ForceFlattenCommand& c) { onForceFlatten(c); });
  subscriptions_.add<OperatorResetCommand>(
      [this](const OperatorResetCommand& c) { onOperatorReset(c); });
  subscriptions_.add<ExitStateChangedEvent>(
      [this](const ExitStateChangedEvent& e) { onExitStateChanged(e); });
}

// -----------------------------------------------------------------------------
// restorePosition: replay, then clear an exit the restart interrupted
// -----------------------------------------------------------------------------
bool PositionDesk::restorePosition(const domain::Position& row) {
  domain::Position restored;
  try {
    restored = ledger_.restore(row);
  } catch (const LedgerCorruptionError& e) {
    std::cerr << "[PositionDesk] FATAL: " << row.key().toString() << " "
              << e.what() << "\n";
    return false;
  }

  if (restored.exit_state != domain::ExitState::Idle) {
    const std::string reason = std::string("restart during ") +
                               domain::toString(restored.exit_state);
    ledger_.setExitState(restored.key(), domain::ExitState::Idle, reason);
    if (!restored.isFlat()) {
      ledger_.setNeedsAttention(restored.key(), true);
      ledger_.recordError(restored.key(),
                          reason + "; exit outcome unknown, verify and reset");
    }
  }
  return true;
}

void PositionDesk::restoreDcaConfig(const domain::PositionKey& key,
                                    const domain::DcaConfig& config) {
  dca_.restoreConfig(key, config);
}

domain::PositionStatus PositionDesk::status(
    const domain::PositionKey& key) const {
  domain::PositionStatus status;
  status.position = ledger_.currentPosition(key);
  status.exit_state = status.position.exit_state;
  status.pnl = pnl_.snapshot(key);
  status.drift_records = reconciler_.driftRecords(key);
  return status;
}

// -----------------------------------------------------------------------------
// Command handlers
// -----------------------------------------------------------------------------
void PositionDesk::onOpen(const OpenPositionCommand& command) {
  answer(command.reply, [&] { return open(command); });
}

void PositionDesk::onExit(const ExitCommand& command) {
  answer(command.reply, [&] {
    return exits_.requestExit(command.key, command.reason);
  });
}

void PositionDesk::onForceFlatten(const ForceFlattenCommand& command) {
  answer(command.reply, [&] {
    return kill_switch_.activate(command.key, command.reason);
  });
}

void PositionDesk::onOperatorReset(const OperatorResetCommand& command) {
  answer(command.reply, [&] { return operatorReset(command.key); });
}

// -----------------------------------------------------------------------------
// open: entry, scale-in or reversal
// -----------------------------------------------------------------------------
domain::CommandResult PositionDesk::open(const OpenPositionCommand& command) {
  const domain::PositionKey& key = command.key;
  if (command.quantity <= 0) {
    throw RejectError("quantity must be positive");
  }

  const domain::Position position = ledger_.currentPosition(key);
  if (position.exit_state != domain::ExitState::Idle ||
      pending_entries_.count(key) > 0) {
    throw ConflictingIntentError("exit in flight for " + key.toString() +
                                 " (" + domain::toString(position.exit_state) +
                                 ")");
  }
  if (position.halted) {
    throw RejectError(key.toString() + " is halted; operator reset required");
  }
  if (position.needs_attention) {
    throw RejectError(key.toString() +
                      " needs attention; operator reset required");
  }

  if (command.dca) {
    dca_.configure(key, *command.dca);
  }

  const bool reversal =
      !position.isFlat() &&
      domain::positionSideFor(position.quantity) !=
          domain::positionSideFor(domain::sideSign(command.side));
  if (!reversal) {
    const domain::BrokerOrderId id =
        placeEntry(key, command.side, command.quantity);
    return {true, domain::ExitState::Idle,
            (position.isFlat() ? "entry order " : "scale-in order ") + id};
  }

  pending_entries_[key] = PendingEntry{command.side, command.quantity};
  domain::CommandResult exit = exits_.requestExit(key, "reversal");
  if (!exit.accepted) {
    pending_entries_.erase(key);
    exit.message = "reversal aborted: " + exit.message;
    return exit;
  }
  // The exit may already have completed and placed the entry.
  const domain::ExitState now = ledger_.currentPosition(key).exit_state;
  return {true, now, "reversal: " + exit.message + "; entry follows flat"};
}

domain::BrokerOrderId PositionDesk::placeEntry(const domain::PositionKey& key,
                                               domain::Side side,
                                               std::int64_t quantity) {
  const domain::OrderIntent intent = domain::OrderIntent::market(
      key, side, quantity, domain::OrderPurpose::Entry);
  const domain::BrokerOrderId id = resources_.gateway.placeOrder(intent);
  tracker_.track(id, intent, resources_.time_provider.now_ms());
  std::cout << "[PositionDesk] " << key.toString() << " "
            << domain::toString(side) << " " << quantity << " → " << id
            << "\n";
  return id;
}

// -----------------------------------------------------------------------------
// onExitStateChanged: place a parked reversal entry once flat
// -----------------------------------------------------------------------------
void PositionDesk::onExitStateChanged(const ExitStateChangedEvent& event) {
  if (event.to != domain::ExitState::Idle) {
    return;
  }
  auto it = pending_entries_.find(event.key);
  if (it == pending_entries_.end()) {
    return;
  }
  const PendingEntry entry = it->second;
  pending_entries_.erase(it);

  const domain::Position position = ledger_.currentPosition(event.key);
  if (!position.isFlat() || position.halted || position.needs_attention) {
    const std::string message =
        "reversal entry dropped: exit ended without a clean flat (" +
        event.reason + ")";
    std::cerr << "[PositionDesk] " << event.key.toString() << " " << message
              << "\n";
    ledger_.recordError(event.key, message);
    return;
  }

  try {
    placeEntry(event.key, entry.side, entry.quantity);
  } catch (const FlatguardError& e) {
    const std::string message = std::string("reversal entry failed: ") + e.what();
    std::cerr << "[PositionDesk] " << event.key.toString() << " " << message
              << "\n";
    ledger_.recordError(event.key, message);
  }
}

// -----------------------------------------------------------------------------
// operatorReset
// -----------------------------------------------------------------------------
domain::CommandResult PositionDesk::operatorReset(
    const domain::PositionKey& key) {
  if (kill_switch_.isActive(key)) {
    return {false, ledger_.currentPosition(key).exit_state,
            "kill switch in progress"};
  }

  pending_entries_.erase(key);
  exits_.forget(key);
  ledger_.setHalted(key, false, "operator reset");
  ledger_.setNeedsAttention(key, false);
  if (ledger_.currentPosition(key).exit_state != domain::ExitState::Idle) {
    ledger_.setExitState(key, domain::ExitState::Idle, "operator reset");
  }

  std::cout << "[PositionDesk] operator reset " << key.toString()
            << "; reconciling with broker\n";
  reconciler_.reconcileKey(key, true);

  const domain::Position position = ledger_.currentPosition(key);
  return {true, position.exit_state,
          "reset; broker reconciled to qty " +
              std::to_string(position.quantity)};
}

}  // namespace flatguard
