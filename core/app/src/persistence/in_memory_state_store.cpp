#include "flatguard/persistence/in_memory_state_store.hpp"

#include <algorithm>

namespace flatguard {

void upsertDrift(std::vector<domain::DriftRecord>& records,
                 const domain::DriftRecord& record) {
  auto it = std::find_if(records.begin(), records.end(),
                         [&](const domain::DriftRecord& r) {
                           return r.id == record.id;
                         });
  if (it != records.end()) {
    *it = record;
  } else {
    records.push_back(record);
  }
}

void InMemoryStateStore::savePosition(const domain::Position& position) {
  std::lock_guard lock(mutex_);
  positions_[position.key()] = position;
  ++position_writes_;
}

std::vector<domain::Position> InMemoryStateStore::loadPositions() {
  std::lock_guard lock(mutex_);
  std::vector<domain::Position> result;
  result.reserve(positions_.size());
  for (const auto& [key, position] : positions_) {
    result.push_back(position);
  }
  return result;
}

void InMemoryStateStore::appendFill(const domain::Fill& fill) {
  std::lock_guard lock(mutex_);
  fills_[fill.key()].push_back(fill);
}

std::vector<domain::Fill> InMemoryStateStore::loadFills(
    const domain::PositionKey& key) {
  std::lock_guard lock(mutex_);
  auto it = fills_.find(key);
  return it == fills_.end() ? std::vector<domain::Fill>{} : it->second;
}

void InMemoryStateStore::replaceFills(const domain::PositionKey& key,
                                      const std::vector<domain::Fill>& fills) {
  std::lock_guard lock(mutex_);
  fills_[key] = fills;
}

void InMemoryStateStore::appendDrift(const domain::DriftRecord& record) {
  std::lock_guard lock(mutex_);
  upsertDrift(drifts_[record.key()], record);
  last_drift_id_ = std::max(last_drift_id_, record.id);
}

std::vector<domain::DriftRecord> InMemoryStateStore::loadDrifts(
    const domain::PositionKey& key) {
  std::lock_guard lock(mutex_);
  auto it = drifts_.find(key);
  return it == drifts_.end() ? std::vector<domain::DriftRecord>{} : it->second;
}

std::uint64_t InMemoryStateStore::lastDriftId() {
  std::lock_guard lock(mutex_);
  return last_drift_id_;
}

void InMemoryStateStore::saveDcaConfig(const domain::PositionKey& key,
                                       const domain::DcaConfig& config) {
  std::lock_guard lock(mutex_);
  dca_configs_[key] = config;
}

std::map<domain::PositionKey, domain::DcaConfig>
InMemoryStateStore::loadDcaConfigs() {
  std::lock_guard lock(mutex_);
  return dca_configs_;
}

std::size_t InMemoryStateStore::positionWrites() const {
  std::lock_guard lock(mutex_);
  return position_writes_;
}

}  // namespace flatguard
