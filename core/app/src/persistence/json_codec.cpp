#include "flatguard/persistence/json_codec.hpp"
#include "flatguard/domain/errors.hpp"

namespace flatguard {
namespace domain {

namespace {

template <typename Enum, typename Parser>
Enum parseOrThrow(const nlohmann::json& j, const char* field, Parser parse) {
  const std::string text = j.at(field).get<std::string>();
  std::optional<Enum> value = parse(text);
  if (!value) {
    throw ConfigError(std::string("invalid ") + field + ": '" + text + "'");
  }
  return *value;
}

}  // namespace

// -----------------------------------------------------------------------------
// Fill
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Fill& fill) {
  j = nlohmann::json{{"fill_id", fill.fill_id},
                     {"order_id", fill.order_id},
                     {"account_id", fill.account_id},
                     {"symbol", fill.symbol},
                     {"side", toString(fill.side)},
                     {"quantity", fill.quantity},
                     {"price", fill.price},
                     {"timestamp_ms", fill.timestamp_ms},
                     {"role", toString(fill.role)}};
}

void from_json(const nlohmann::json& j, Fill& fill) {
  fill.fill_id = j.at("fill_id").get<std::string>();
  fill.order_id = j.value("order_id", std::string{});
  fill.account_id = j.at("account_id").get<std::string>();
  fill.symbol = j.at("symbol").get<std::string>();
  fill.side = parseOrThrow<Side>(j, "side", parseSide);
  fill.quantity = j.at("quantity").get<std::int64_t>();
  fill.price = j.at("price").get<double>();
  fill.timestamp_ms = j.value("timestamp_ms", std::int64_t{0});
  fill.role = j.contains("role")
                  ? parseOrThrow<FillRole>(j, "role", parseFillRole)
                  : FillRole::Entry;
}

// -----------------------------------------------------------------------------
// Position
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Position& position) {
  j = nlohmann::json{
      {"account_id", position.account_id},
      {"symbol", position.symbol},
      {"side", toString(position.side)},
      {"quantity", position.quantity},
      {"average_entry_price", position.average_entry_price},
      {"opened_at_ms", position.opened_at_ms},
      {"closed_at_ms", position.closed_at_ms},
      {"realized_pnl", position.realized_pnl},
      {"unrealized_pnl", position.unrealized_pnl},
      {"worst_unrealized_pnl", position.worst_unrealized_pnl},
      {"best_unrealized_pnl", position.best_unrealized_pnl},
      {"dca_triggered_indices", position.dca_triggered_indices},
      {"exit_state", toString(position.exit_state)},
      {"halted", position.halted},
      {"needs_attention", position.needs_attention},
      {"last_transition", position.last_transition},
      {"last_error", position.last_error},
      {"fill_count", position.fill_count}};
}

void from_json(const nlohmann::json& j, Position& position) {
  position.account_id = j.at("account_id").get<std::string>();
  position.symbol = j.at("symbol").get<std::string>();
  position.quantity = j.at("quantity").get<std::int64_t>();
  position.side = positionSideFor(position.quantity);
  position.average_entry_price = j.value("average_entry_price", 0.0);
  position.opened_at_ms = j.value("opened_at_ms", std::int64_t{0});
  position.closed_at_ms = j.value("closed_at_ms", std::int64_t{0});
  position.realized_pnl = j.value("realized_pnl", 0.0);
  position.unrealized_pnl = j.value("unrealized_pnl", 0.0);
  position.worst_unrealized_pnl = j.value("worst_unrealized_pnl", 0.0);
  position.best_unrealized_pnl = j.value("best_unrealized_pnl", 0.0);
  position.dca_triggered_indices =
      j.value("dca_triggered_indices", std::set<int>{});
  position.exit_state =
      j.contains("exit_state")
          ? parseOrThrow<ExitState>(j, "exit_state", parseExitState)
          : ExitState::Idle;
  position.halted = j.value("halted", false);
  position.needs_attention = j.value("needs_attention", false);
  position.last_transition = j.value("last_transition", std::string{});
  position.last_error = j.value("last_error", std::string{});
  position.fill_count = j.value("fill_count", std::uint64_t{0});
}

// -----------------------------------------------------------------------------
// DriftRecord
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const DriftRecord& record) {
  j = nlohmann::json{{"id", record.id},
                     {"account_id", record.account_id},
                     {"symbol", record.symbol},
                     {"virtual_quantity", record.virtual_quantity},
                     {"broker_quantity", record.broker_quantity},
                     {"detected_at_ms", record.detected_at_ms},
                     {"resolution", toString(record.resolution)},
                     {"resolved_at_ms", record.resolved_at_ms},
                     {"note", record.note}};
}

void from_json(const nlohmann::json& j, DriftRecord& record) {
  record.id = j.at("id").get<std::uint64_t>();
  record.account_id = j.at("account_id").get<std::string>();
  record.symbol = j.at("symbol").get<std::string>();
  record.virtual_quantity = j.at("virtual_quantity").get<std::int64_t>();
  record.broker_quantity = j.at("broker_quantity").get<std::int64_t>();
  record.detected_at_ms = j.value("detected_at_ms", std::int64_t{0});
  record.resolution = parseOrThrow<DriftResolution>(j, "resolution",
                                                    parseDriftResolution);
  record.resolved_at_ms = j.value("resolved_at_ms", std::int64_t{0});
  record.note = j.value("note", std::string{});
}

// -----------------------------------------------------------------------------
// DcaConfig
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const DcaRung& rung) {
  j = nlohmann::json{{"distance", rung.distance}, {"quantity", rung.quantity}};
}

void from_json(const nlohmann::json& j, DcaRung& rung) {
  rung.distance = j.at("distance").get<double>();
  rung.quantity = j.at("quantity").get<std::int64_t>();
}

void to_json(nlohmann::json& j, const DcaConfig& config) {
  j = nlohmann::json{{"mode", toString(config.mode)},
                     {"rungs", config.rungs},
                     {"max_quantity", config.max_quantity},
                     {"take_profit_ticks", config.take_profit_ticks},
                     {"stop_loss_ticks", config.stop_loss_ticks}};
}

void from_json(const nlohmann::json& j, DcaConfig& config) {
  config.mode = j.contains("mode")
                    ? parseOrThrow<DcaTriggerMode>(j, "mode",
                                                   parseDcaTriggerMode)
                    : DcaTriggerMode::Ticks;
  config.rungs = j.value("rungs", std::vector<DcaRung>{});
  config.max_quantity = j.value("max_quantity", std::int64_t{0});
  config.take_profit_ticks = j.value("take_profit_ticks", 0);
  config.stop_loss_ticks = j.value("stop_loss_ticks", 0);
}

}  // namespace domain
}  // namespace flatguard
