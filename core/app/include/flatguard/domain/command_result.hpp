#pragma once

#include "flatguard/domain/drift_record.hpp"
#include "flatguard/domain/exit_state.hpp"
#include "flatguard/domain/position.hpp"

#include <string>
#include <vector>

namespace flatguard {
namespace domain {

// Outcome of an API command. accepted == false means the command was a
// no-op or refused; message says why. exit_state is the state after the
// command was handled.
struct CommandResult {
  bool accepted{false};
  ExitState exit_state{ExitState::Idle};
  std::string message;
};

struct PnlSnapshot {
  double realized{0.0};
  double unrealized{0.0};
  double worst_unrealized{0.0};
  double best_unrealized{0.0};
};

// Answer to getStatus(account, symbol).
struct PositionStatus {
  Position position;
  ExitState exit_state{ExitState::Idle};
  PnlSnapshot pnl;
  std::vector<DriftRecord> drift_records;
};

}  // namespace domain
}  // namespace flatguard
