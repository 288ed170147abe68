#pragma once

#include "flatguard/domain/exit_state.hpp"
#include "flatguard/domain/types.hpp"

#include <cstdint>
#include <set>
#include <string>

namespace flatguard {
namespace domain {

// -----------------------------------------------------------------------------
// Position — per-(account, symbol) trading state
// -----------------------------------------------------------------------------
// @brief  Derived cache of the fill log plus the controller state that the
//         fill log cannot express (exit state, fired DCA rungs, halt flags).
//
// @details
// Sign convention for quantity:
//   positive → long, negative → short, zero → flat.
//
// Derived from fills (PositionLedger::applyFill):
//   side, quantity, average_entry_price, realized_pnl, opened_at_ms,
//   closed_at_ms, fill_count.
//
// Marked to market (PnlEngine):
//   unrealized_pnl, worst_unrealized_pnl, best_unrealized_pnl.
//   worst_unrealized_pnl only ever moves down within one open lifecycle.
//
// Controller state (persisted with the row, survives restarts):
//   dca_triggered_indices, exit_state, halted, needs_attention.
//
// average_entry_price is only meaningful while quantity != 0; the ledger
// resets it to 0 whenever the position goes flat.
//
// Thread model:
//   Value type. The authoritative copy lives in one PositionLedger and is
//   only mutated on that ledger's event loop thread.
// -----------------------------------------------------------------------------
struct Position {
  AccountId account_id;
  Symbol symbol;

  PositionSide side{PositionSide::Flat};
  std::int64_t quantity{0};
  double average_entry_price{0.0};

  std::int64_t opened_at_ms{0};
  std::int64_t closed_at_ms{0};

  double realized_pnl{0.0};
  double unrealized_pnl{0.0};
  double worst_unrealized_pnl{0.0};
  double best_unrealized_pnl{0.0};

  std::set<int> dca_triggered_indices;

  ExitState exit_state{ExitState::Idle};

  // halted: fatal condition; no automated action until operator reset.
  // needs_attention: a failure an operator should review (e.g. a rejected
  // exit). Blocks automated DCA and exit triggers, not manual commands.
  bool halted{false};
  bool needs_attention{false};

  // Last recorded transition and last error, for status queries.
  std::string last_transition;
  std::string last_error;

  // Number of fills applied. Compared on restart against a replay of the
  // fill log to detect corruption.
  std::uint64_t fill_count{0};

  PositionKey key() const { return PositionKey{account_id, symbol}; }
  bool isFlat() const { return quantity == 0; }
};

}  // namespace domain
}  // namespace flatguard
