#pragma once

#include <optional>
#include <string>

namespace flatguard {
namespace domain {

// -----------------------------------------------------------------------------
// ExitState — per-position exit controller state
// -----------------------------------------------------------------------------
//
// @brief  Closed set of states driven by ExitStateMachine and KillSwitch.
//
// @details
//   Idle        — no exit in flight. The only state in which a position may
//                 grow (entries, scale-ins).
//   PrepareExit — protective orders are being cancelled and the broker's
//                 quantity is being queried.
//   WorkingExit — a market exit order is working at the broker.
//   ConfirmFlat — the exit has filled (or the kill switch fired); waiting
//                 for the broker to report quantity zero.
//
// Legal transitions (isLegalExitTransition):
//   Idle        → PrepareExit, ConfirmFlat (kill switch)
//   PrepareExit → WorkingExit, ConfirmFlat (kill switch), Idle (abandoned)
//   WorkingExit → ConfirmFlat, Idle (rejected)
//   ConfirmFlat → Idle
// -----------------------------------------------------------------------------
enum class ExitState {
  Idle,
  PrepareExit,
  WorkingExit,
  ConfirmFlat,
};

inline bool isLegalExitTransition(ExitState current, ExitState next) {
  using S = ExitState;

  switch (current) {
    case S::Idle:
      return next == S::PrepareExit ||
             next == S::ConfirmFlat;

    case S::PrepareExit:
      return next == S::WorkingExit ||
             next == S::ConfirmFlat ||
             next == S::Idle;

    case S::WorkingExit:
      return next == S::ConfirmFlat ||
             next == S::Idle;

    case S::ConfirmFlat:
      return next == S::Idle;
  }

  return false;
}

const char* toString(ExitState state);
std::optional<ExitState> parseExitState(const std::string& text);

}  // namespace domain
}  // namespace flatguard
