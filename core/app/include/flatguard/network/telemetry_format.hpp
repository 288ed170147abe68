#pragma once

#include "flatguard/domain/command_result.hpp"
#include "flatguard/domain/position.hpp"
#include "flatguard/events/event.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace flatguard {

// -----------------------------------------------------------------------------
// Telemetry and status JSON
// -----------------------------------------------------------------------------
// formatTelemetry() turns the operator-facing engine events into one-line
// JSON for the PUB socket:
//   PositionChangedEvent  → {"type":"position", ...}
//   ExitStateChangedEvent → {"type":"exit_state", ...}
//   DriftDetectedEvent    → {"type":"drift", ...}
//   AlertEvent            → {"type":"alert", ...}
// Any other event yields nullopt.
//
// statusToJson() is the payload of the STATUS command.
// -----------------------------------------------------------------------------
std::optional<std::string> formatTelemetry(const Event& event);

nlohmann::json positionToJson(const domain::Position& position);
nlohmann::json statusToJson(const domain::PositionStatus& status);
nlohmann::json commandResultToJson(const domain::CommandResult& result);

}  // namespace flatguard
