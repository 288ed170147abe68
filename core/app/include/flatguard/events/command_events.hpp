#pragma once

#include "flatguard/domain/command_result.hpp"
#include "flatguard/domain/dca_config.hpp"
#include "flatguard/domain/types.hpp"

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace flatguard {

// -----------------------------------------------------------------------------
// API commands
// -----------------------------------------------------------------------------
// TradingEngine turns each public API call into one of these and pushes it
// onto the owning shard, so commands are serialized with broker events for
// the same position. The shard fulfils `reply` once handled. `reply` is a
// shared_ptr because Event must stay copyable and std::promise is not.
// A null reply means fire-and-forget.
// -----------------------------------------------------------------------------
using CommandReply = std::shared_ptr<std::promise<domain::CommandResult>>;

struct OpenPositionCommand {
  domain::PositionKey key;
  domain::Side side{domain::Side::Buy};
  std::int64_t quantity{0};
  std::optional<domain::DcaConfig> dca;
  CommandReply reply;
};

struct ExitCommand {
  domain::PositionKey key;
  std::string reason;
  CommandReply reply;
};

struct ForceFlattenCommand {
  domain::PositionKey key;
  std::string reason;
  CommandReply reply;
};

struct OperatorResetCommand {
  domain::PositionKey key;
  CommandReply reply;
};

}  // namespace flatguard
