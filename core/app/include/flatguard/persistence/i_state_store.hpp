#pragma once

#include "flatguard/domain/dca_config.hpp"
#include "flatguard/domain/drift_record.hpp"
#include "flatguard/domain/fill.hpp"
#include "flatguard/domain/position.hpp"

#include <cstdint>
#include <map>
#include <vector>

namespace flatguard {

// -----------------------------------------------------------------------------
// IStateStore — durable home of positions, fills and drift records
// -----------------------------------------------------------------------------
//
// @brief  Everything the engine needs to come back after a crash without
//         double-firing a DCA rung or forgetting an exit in flight.
//
// @details
// Write ordering used by PositionLedger: appendFill() before savePosition().
// A crash between the two leaves a fill the position row does not reflect;
// startup replays the fill log and treats the replay as authoritative.
//
//   savePosition     upsert one row (quantity, avg, controller state)
//   loadPositions    every stored row, flat ones included
//   appendFill       append to the (account, symbol) fill log
//   loadFills        that log, in append order
//   replaceFills     swap the whole log for one key (rebuild from broker)
//   appendDrift      upsert by DriftRecord::id
//   loadDrifts       drift history for one key, oldest first
//   lastDriftId      highest DriftRecord id ever written (0 if none)
//   saveDcaConfig    per-position ladder, so it survives a restart
//   loadDcaConfigs   all stored ladders
//
// Every method throws StateStoreError when the medium fails.
//
// Thread model: Implementations must be safe to call from every shard at
//               once.
// -----------------------------------------------------------------------------
class IStateStore {
 public:
  virtual ~IStateStore() = default;

  virtual void savePosition(const domain::Position& position) = 0;
  virtual std::vector<domain::Position> loadPositions() = 0;

  virtual void appendFill(const domain::Fill& fill) = 0;
  virtual std::vector<domain::Fill> loadFills(const domain::PositionKey& key) = 0;
  virtual void replaceFills(const domain::PositionKey& key,
                            const std::vector<domain::Fill>& fills) = 0;

  virtual void appendDrift(const domain::DriftRecord& record) = 0;
  virtual std::vector<domain::DriftRecord> loadDrifts(
      const domain::PositionKey& key) = 0;
  virtual std::uint64_t lastDriftId() = 0;

  virtual void saveDcaConfig(const domain::PositionKey& key,
                             const domain::DcaConfig& config) = 0;
  virtual std::map<domain::PositionKey, domain::DcaConfig> loadDcaConfigs() = 0;
};

}  // namespace flatguard
