#pragma once

#include "flatguard/persistence/i_state_store.hpp"

#include <map>
#include <mutex>

namespace flatguard {

// -----------------------------------------------------------------------------
// InMemoryStateStore
// -----------------------------------------------------------------------------
// IStateStore kept in process memory. Used by tests and by the simulated
// environment when no state_dir is configured. A test can keep one instance
// alive across two engine lifetimes to simulate a restart.
// -----------------------------------------------------------------------------
class InMemoryStateStore final : public IStateStore {
 public:
  InMemoryStateStore() = default;

  InMemoryStateStore(const InMemoryStateStore&) = delete;
  InMemoryStateStore& operator=(const InMemoryStateStore&) = delete;

  void savePosition(const domain::Position& position) override;
  std::vector<domain::Position> loadPositions() override;

  void appendFill(const domain::Fill& fill) override;
  std::vector<domain::Fill> loadFills(const domain::PositionKey& key) override;
  void replaceFills(const domain::PositionKey& key,
                    const std::vector<domain::Fill>& fills) override;

  void appendDrift(const domain::DriftRecord& record) override;
  std::vector<domain::DriftRecord> loadDrifts(
      const domain::PositionKey& key) override;
  std::uint64_t lastDriftId() override;

  void saveDcaConfig(const domain::PositionKey& key,
                     const domain::DcaConfig& config) override;
  std::map<domain::PositionKey, domain::DcaConfig> loadDcaConfigs() override;

  // Number of savePosition() calls so far.
  std::size_t positionWrites() const;

 private:
  mutable std::mutex mutex_;
  std::map<domain::PositionKey, domain::Position> positions_;
  std::map<domain::PositionKey, std::vector<domain::Fill>> fills_;
  std::map<domain::PositionKey, std::vector<domain::DriftRecord>> drifts_;
  std::map<domain::PositionKey, domain::DcaConfig> dca_configs_;
  std::uint64_t last_drift_id_{0};
  std::size_t position_writes_{0};
};

// Shared by both store implementations: replace the record with the same
// id, or append.
void upsertDrift(std::vector<domain::DriftRecord>& records,
                 const domain::DriftRecord& record);

}  // namespace flatguard
