#include "flatguard/domain/drift_record.hpp"
#include "flatguard/domain/dca_config.hpp"
#include "flatguard/domain/exit_state.hpp"
#include "flatguard/domain/types.hpp"

namespace flatguard {
namespace domain {

const char* toString(Side side) {
  switch (side) {
    case Side::Buy:  return "Buy";
    case Side::Sell: return "Sell";
  }
  return "Unknown";
}

const char* toString(PositionSide side) {
  switch (side) {
    case PositionSide::Long:  return "Long";
    case PositionSide::Short: return "Short";
    case PositionSide::Flat:  return "Flat";
  }
  return "Unknown";
}

const char* toString(OrderType type) {
  switch (type) {
    case OrderType::Market: return "Market";
    case OrderType::Limit:  return "Limit";
  }
  return "Unknown";
}

const char* toString(OrderPurpose purpose) {
  switch (purpose) {
    case OrderPurpose::Entry:      return "Entry";
    case OrderPurpose::TakeProfit: return "TakeProfit";
    case OrderPurpose::StopLoss:   return "StopLoss";
    case OrderPurpose::DcaEntry:   return "DcaEntry";
    case OrderPurpose::Exit:       return "Exit";
  }
  return "Unknown";
}

const char* toString(FillRole role) {
  switch (role) {
    case FillRole::Entry:     return "Entry";
    case FillRole::Exit:      return "Exit";
    case FillRole::Dca:       return "Dca";
    case FillRole::Reconcile: return "Reconcile";
  }
  return "Unknown";
}

const char* toString(ExitState state) {
  switch (state) {
    case ExitState::Idle:        return "IDLE";
    case ExitState::PrepareExit: return "PREPARE_EXIT";
    case ExitState::WorkingExit: return "WORKING_EXIT";
    case ExitState::ConfirmFlat: return "CONFIRM_FLAT";
  }
  return "UNKNOWN";
}

const char* toString(DcaTriggerMode mode) {
  switch (mode) {
    case DcaTriggerMode::Ticks:   return "TICKS";
    case DcaTriggerMode::Percent: return "PERCENT";
    case DcaTriggerMode::Atr:     return "ATR";
  }
  return "UNKNOWN";
}

const char* toString(DriftResolution resolution) {
  switch (resolution) {
    case DriftResolution::Pending:               return "Pending";
    case DriftResolution::RebuiltFromBrokerFills: return "RebuiltFromBrokerFills";
    case DriftResolution::CorrectedToBroker:     return "CorrectedToBroker";
    case DriftResolution::Unresolved:            return "Unresolved";
  }
  return "Unknown";
}

std::optional<Side> parseSide(const std::string& text) {
  if (text == "Buy" || text == "buy" || text == "long") return Side::Buy;
  if (text == "Sell" || text == "sell" || text == "short") return Side::Sell;
  return std::nullopt;
}

std::optional<OrderType> parseOrderType(const std::string& text) {
  if (text == "Market") return OrderType::Market;
  if (text == "Limit") return OrderType::Limit;
  return std::nullopt;
}

std::optional<OrderPurpose> parseOrderPurpose(const std::string& text) {
  if (text == "Entry") return OrderPurpose::Entry;
  if (text == "TakeProfit") return OrderPurpose::TakeProfit;
  if (text == "StopLoss") return OrderPurpose::StopLoss;
  if (text == "DcaEntry") return OrderPurpose::DcaEntry;
  if (text == "Exit") return OrderPurpose::Exit;
  return std::nullopt;
}

std::optional<FillRole> parseFillRole(const std::string& text) {
  if (text == "Entry") return FillRole::Entry;
  if (text == "Exit") return FillRole::Exit;
  if (text == "Dca") return FillRole::Dca;
  if (text == "Reconcile") return FillRole::Reconcile;
  return std::nullopt;
}

std::optional<ExitState> parseExitState(const std::string& text) {
  if (text == "IDLE") return ExitState::Idle;
  if (text == "PREPARE_EXIT") return ExitState::PrepareExit;
  if (text == "WORKING_EXIT") return ExitState::WorkingExit;
  if (text == "CONFIRM_FLAT") return ExitState::ConfirmFlat;
  return std::nullopt;
}

std::optional<DcaTriggerMode> parseDcaTriggerMode(const std::string& text) {
  if (text == "TICKS" || text == "ticks") return DcaTriggerMode::Ticks;
  if (text == "PERCENT" || text == "percent") return DcaTriggerMode::Percent;
  if (text == "ATR" || text == "atr") return DcaTriggerMode::Atr;
  return std::nullopt;
}

std::optional<DriftResolution> parseDriftResolution(const std::string& text) {
  if (text == "Pending") return DriftResolution::Pending;
  if (text == "RebuiltFromBrokerFills") {
    return DriftResolution::RebuiltFromBrokerFills;
  }
  if (text == "CorrectedToBroker") return DriftResolution::CorrectedToBroker;
  if (text == "Unresolved") return DriftResolution::Unresolved;
  return std::nullopt;
}

}  // namespace domain
}  // namespace flatguard
