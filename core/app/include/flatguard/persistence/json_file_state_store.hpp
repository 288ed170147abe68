#pragma once

#include "flatguard/persistence/i_state_store.hpp"

#include <map>
#include <mutex>
#include <string>

namespace flatguard {

// -----------------------------------------------------------------------------
// JsonFileStateStore — IStateStore on plain JSON files in one directory
// -----------------------------------------------------------------------------
//
// @brief  Durable store for a single engine process.
//
// @details
// Layout under `directory`:
//   positions.json    object keyed by "account:symbol", rewritten whole on
//                     every savePosition()
//   dca_configs.json  same shape, one ladder per key
//   fills.jsonl       one Fill per line, appended
//   drifts.jsonl      one DriftRecord per line, appended; the last line for
//                     an id wins
//
// Whole-file rewrites go to "<file>.tmp" and are renamed over the target,
// so a crash leaves either the old or the new file, never a torn one.
// Appends are flushed before the call returns. A torn final line in a
// .jsonl file (crash mid-append) is skipped with a warning on load.
// replaceFills() rewrites fills.jsonl through the same temp+rename path.
//
// Everything is loaded into memory at construction and served from there;
// the files are only read again on the next start.
//
// Thread model: One mutex serializes every call.
// Ownership:    Owned by main(). Only one process may use a directory.
// -----------------------------------------------------------------------------
class JsonFileStateStore final : public IStateStore {
 public:
  // Creates the directory if needed and loads whatever is there.
  // Throws StateStoreError if the directory cannot be created or a file
  // is unreadable.
  explicit JsonFileStateStore(std::string directory);

  JsonFileStateStore(const JsonFileStateStore&) = delete;
  JsonFileStateStore& operator=(const JsonFileStateStore&) = delete;

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

  const std::string& directory() const { return directory_; }

 private:
  std::string pathOf(const char* file) const;

  void loadAll();
  void writePositionsLocked();
  void writeDcaConfigsLocked();
  void rewriteFillsLocked();

  std::string directory_;

  std::mutex mutex_;
  std::map<domain::PositionKey, domain::Position> positions_;
  std::map<domain::PositionKey, std::vector<domain::Fill>> fills_;
  std::map<domain::PositionKey, std::vector<domain::DriftRecord>> drifts_;
  std::map<domain::PositionKey, domain::DcaConfig> dca_configs_;
  std::uint64_t last_drift_id_{0};
};

}  // namespace flatguard
