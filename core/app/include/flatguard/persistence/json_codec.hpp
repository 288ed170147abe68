#pragma once

#include "flatguard/domain/dca_config.hpp"
#include "flatguard/domain/drift_record.hpp"
#include "flatguard/domain/fill.hpp"
#include "flatguard/domain/position.hpp"

#include <nlohmann/json.hpp>

namespace flatguard {
namespace domain {

// -----------------------------------------------------------------------------
// nlohmann::json conversions for the persisted domain types
// -----------------------------------------------------------------------------
// Found by ADL, so `nlohmann::json j = fill;` and `j.get<Fill>()` work
// anywhere this header is included. Enums are written as the strings from
// domain_strings.cpp; an unknown string throws ConfigError on read (state
// files and config files share the same codec).
//
// Missing optional members fall back to the struct defaults, so a row
// written by an older build still loads.
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Fill& fill);
void from_json(const nlohmann::json& j, Fill& fill);

void to_json(nlohmann::json& j, const Position& position);
void from_json(const nlohmann::json& j, Position& position);

void to_json(nlohmann::json& j, const DriftRecord& record);
void from_json(const nlohmann::json& j, DriftRecord& record);

void to_json(nlohmann::json& j, const DcaRung& rung);
void from_json(const nlohmann::json& j, DcaRung& rung);

void to_json(nlohmann::json& j, const DcaConfig& config);
void from_json(const nlohmann::json& j, DcaConfig& config);

}  // namespace domain
}  // namespace flatguard
