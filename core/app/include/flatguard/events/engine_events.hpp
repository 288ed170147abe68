#pragma once

#include "flatguard/domain/drift_record.hpp"
#include "flatguard/domain/exit_state.hpp"
#include "flatguard/domain/fill.hpp"
#include "flatguard/domain/position.hpp"
#include "flatguard/events/event_types.hpp"

#include <optional>
#include <string>

namespace flatguard {

// -----------------------------------------------------------------------------
// PositionChangedEvent
// -----------------------------------------------------------------------------
// @brief  Published by PositionLedger after a fill is booked or the position
//         is rebuilt. Carries a snapshot, plus the fill when there is one.
//
// Consumers on the same loop: PnlEngine (re-mark), DcaEngine (protective
// order refresh), ExitStateMachine (exit fill), KillSwitch (ledger settled).
// Also forwarded to IPC telemetry.
// -----------------------------------------------------------------------------
struct PositionChangedEvent {
  domain::Position position;
  std::optional<domain::Fill> fill;
  domain::ExitState previous_exit_state{domain::ExitState::Idle};
  Timestamp timestamp{};
};

// Published on every exit-state transition.
struct ExitStateChangedEvent {
  domain::PositionKey key;
  domain::ExitState from{domain::ExitState::Idle};
  domain::ExitState to{domain::ExitState::Idle};
  std::string reason;
  Timestamp timestamp{};
};

// Published by DriftReconciler on detection and again on resolution.
struct DriftDetectedEvent {
  domain::DriftRecord record;
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// AlertEvent
// -----------------------------------------------------------------------------
// Operator-facing notice. Warning: something was refused or failed and is
// recorded on the position. Fatal: automated action on the position has
// stopped (kill-switch deadline, ledger corruption) until operator reset.
// -----------------------------------------------------------------------------
struct AlertEvent {
  enum class Severity { Warning, Fatal };

  domain::PositionKey key;
  Severity severity{Severity::Warning};
  std::string source;    // Component name, e.g. "KillSwitch"
  std::string message;
  Timestamp timestamp{};
};

}  // namespace flatguard
