#include "flatguard/network/telemetry_format.hpp"
#include "flatguard/persistence/json_codec.hpp"
#include "flatguard/time/time_utils.hpp"

namespace flatguard {

namespace {

std::string formatPosition(const PositionChangedEvent& e) {
  nlohmann::json j = positionToJson(e.position);
  j["type"] = "position";
  if (e.fill) {
    j["fill"] = *e.fill;
  }
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

std::string formatExitState(const ExitStateChangedEvent& e) {
  nlohmann::json j;
  j["type"] = "exit_state";
  j["account_id"] = e.key.account_id;
  j["symbol"] = e.key.symbol;
  j["from"] = domain::toString(e.from);
  j["to"] = domain::toString(e.to);
  j["reason"] = e.reason;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

std::string formatDrift(const DriftDetectedEvent& e) {
  nlohmann::json j = e.record;
  j["type"] = "drift";
  return j.dump();
}

std::string formatAlert(const AlertEvent& e) {
  nlohmann::json j;
  j["type"] = "alert";
  j["account_id"] = e.key.account_id;
  j["symbol"] = e.key.symbol;
  j["severity"] =
      e.severity == AlertEvent::Severity::Fatal ? "fatal" : "warning";
  j["source"] = e.source;
  j["message"] = e.message;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

}  // namespace

// -----------------------------------------------------------------------------
// formatTelemetry(): dispatch Event variant to per-type formatters
// -----------------------------------------------------------------------------
std::optional<std::string> formatTelemetry(const Event& event) {
  if (auto* e = std::get_if<PositionChangedEvent>(&event)) {
    return formatPosition(*e);
  }
  if (auto* e = std::get_if<ExitStateChangedEvent>(&event)) {
    return formatExitState(*e);
  }
  if (auto* e = std::get_if<DriftDetectedEvent>(&event)) {
    return formatDrift(*e);
  }
  if (auto* e = std::get_if<AlertEvent>(&event)) {
    return formatAlert(*e);
  }
  return std::nullopt;
}

nlohmann::json positionToJson(const domain::Position& position) {
  nlohmann::json j = position;
  // The DCA index set is bookkeeping; operators want the count.
  j["dca_rungs_fired"] = position.dca_triggered_indices.size();
  return j;
}

nlohmann::json statusToJson(const domain::PositionStatus& status) {
  nlohmann::json j;
  j["position"] = positionToJson(status.position);
  j["exit_state"] = domain::toString(status.exit_state);
  j["pnl"] = {{"realized", status.pnl.realized},
              {"unrealized", status.pnl.unrealized},
              {"worst_unrealized", status.pnl.worst_unrealized},
              {"best_unrealized", status.pnl.best_unrealized}};
  j["drift_records"] = nlohmann::json::array();
  for (const domain::DriftRecord& record : status.drift_records) {
    j["drift_records"].push_back(record);
  }
  return j;
}

nlohmann::json commandResultToJson(const domain::CommandResult& result) {
  return {{"accepted", result.accepted},
          {"exit_state", domain::toString(result.exit_state)},
          {"message", result.message}};
}

}  // namespace flatguard
