#include "flatguard/persistence/json_file_state_store.hpp"
#include "flatguard/domain/errors.hpp"
#include "flatguard/persistence/in_memory_state_store.hpp"
#include "flatguard/persistence/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace flatguard {

namespace {

constexpr const char* kPositionsFile = "positions.json";
constexpr const char* kDcaConfigsFile = "dca_configs.json";
constexpr const char* kFillsFile = "fills.jsonl";
constexpr const char* kDriftsFile = "drifts.jsonl";

// Writes `content` to path + ".tmp" and renames it over `path`.
void writeAtomically(const std::string& path, const std::string& content) {
  const std::string temp_path = path + ".tmp";
  {
    std::ofstream out(temp_path, std::ios::trunc);
    if (!out.is_open()) {
      throw StateStoreError("cannot open " + temp_path + " for writing");
    }
    out << content;
    out.flush();
    if (!out) {
      throw StateStoreError("write to " + temp_path + " failed");
    }
  }
  if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
    std::remove(temp_path.c_str());
    throw StateStoreError("rename " + temp_path + " -> " + path + " failed");
  }
}

void appendLine(const std::string& path, const nlohmann::json& line) {
  std::ofstream out(path, std::ios::app);
  if (!out.is_open()) {
    throw StateStoreError("cannot open " + path + " for append");
  }
  out << line.dump() << '\n';
  out.flush();
  if (!out) {
    throw StateStoreError("append to " + path + " failed");
  }
}

// Calls fn(json) for each parseable line. A line that does not parse is
// only tolerated as the last one.
template <typename Fn>
void readJsonLines(const std::string& path, Fn fn) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return;
  }
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  for (std::size_t i = 0; i < lines.size(); ++i) {
    nlohmann::json j;
    try {
      j = nlohmann::json::parse(lines[i]);
    } catch (const nlohmann::json::parse_error& e) {
      if (i + 1 == lines.size()) {
        std::cerr << "[JsonFileStateStore] WARNING: skipping torn last line in "
                  << path << ": " << e.what() << "\n";
        return;
      }
      throw StateStoreError("corrupt line " + std::to_string(i + 1) + " in " +
                            path + ": " + e.what());
    }
    fn(j);
  }
}

nlohmann::json readJsonObject(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return nlohmann::json::object();
  }
  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw StateStoreError("corrupt " + path + ": " + e.what());
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: create the directory and load everything
// -----------------------------------------------------------------------------
JsonFileStateStore::JsonFileStateStore(std::string directory)
    : directory_(std::move(directory)) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw StateStoreError("cannot create state directory " + directory_ +
                          ": " + ec.message());
  }
  loadAll();
  std::cout << "[JsonFileStateStore] loaded " << positions_.size()
            << " position(s), " << fills_.size() << " fill log(s) from "
            << directory_ << "\n";
}

std::string JsonFileStateStore::pathOf(const char* file) const {
  return (std::filesystem::path(directory_) / file).string();
}

void JsonFileStateStore::loadAll() {
  try {
    const nlohmann::json positions = readJsonObject(pathOf(kPositionsFile));
    for (const auto& item : positions.items()) {
      domain::Position position = item.value().get<domain::Position>();
      positions_[position.key()] = position;
    }
    const nlohmann::json configs = readJsonObject(pathOf(kDcaConfigsFile));
    for (const auto& item : configs.items()) {
      const nlohmann::json& row = item.value();
      domain::PositionKey key{row.at("account_id").get<std::string>(),
                              row.at("symbol").get<std::string>()};
      dca_configs_[key] = row.at("config").get<domain::DcaConfig>();
    }
    readJsonLines(pathOf(kFillsFile), [this](const nlohmann::json& j) {
      domain::Fill fill = j.get<domain::Fill>();
      fills_[fill.key()].push_back(fill);
    });
    readJsonLines(pathOf(kDriftsFile), [this](const nlohmann::json& j) {
      domain::DriftRecord record = j.get<domain::DriftRecord>();
      upsertDrift(drifts_[record.key()], record);
      last_drift_id_ = std::max(last_drift_id_, record.id);
    });
  } catch (const nlohmann::json::exception& e) {
    throw StateStoreError("malformed state in " + directory_ + ": " + e.what());
  } catch (const ConfigError& e) {
    throw StateStoreError("malformed state in " + directory_ + ": " + e.what());
  }
}

// -----------------------------------------------------------------------------
// Positions
// -----------------------------------------------------------------------------
void JsonFileStateStore::savePosition(const domain::Position& position) {
  std::lock_guard lock(mutex_);
  positions_[position.key()] = position;
  writePositionsLocked();
}

std::vector<domain::Position> JsonFileStateStore::loadPositions() {
  std::lock_guard lock(mutex_);
  std::vector<domain::Position> result;
  result.reserve(positions_.size());
  for (const auto& [key, position] : positions_) {
    result.push_back(position);
  }
  return result;
}

void JsonFileStateStore::writePositionsLocked() {
  nlohmann::json doc = nlohmann::json::object();
  for (const auto& [key, position] : positions_) {
    doc[key.toString()] = position;
  }
  writeAtomically(pathOf(kPositionsFile), doc.dump(2));
}

// -----------------------------------------------------------------------------
// Fills
// -----------------------------------------------------------------------------
void JsonFileStateStore::appendFill(const domain::Fill& fill) {
  std::lock_guard lock(mutex_);
  appendLine(pathOf(kFillsFile), fill);
  fills_[fill.key()].push_back(fill);
}

std::vector<domain::Fill> JsonFileStateStore::loadFills(
    const domain::PositionKey& key) {
  std::lock_guard lock(mutex_);
  auto it = fills_.find(key);
  return it == fills_.end() ? std::vector<domain::Fill>{} : it->second;
}

void JsonFileStateStore::replaceFills(const domain::PositionKey& key,
                                      const std::vector<domain::Fill>& fills) {
  std::lock_guard lock(mutex_);
  fills_[key] = fills;
  rewriteFillsLocked();
}

void JsonFileStateStore::rewriteFillsLocked() {
  std::string content;
  for (const auto& [key, log] : fills_) {
    for (const domain::Fill& fill : log) {
      content += nlohmann::json(fill).dump();
      content += '\n';
    }
  }
  writeAtomically(pathOf(kFillsFile), content);
}

// -----------------------------------------------------------------------------
// Drift records
// -----------------------------------------------------------------------------
void JsonFileStateStore::appendDrift(const domain::DriftRecord& record) {
  std::lock_guard lock(mutex_);
  appendLine(pathOf(kDriftsFile), record);
  upsertDrift(drifts_[record.key()], record);
  last_drift_id_ = std::max(last_drift_id_, record.id);
}

std::vector<domain::DriftRecord> JsonFileStateStore::loadDrifts(
    const domain::PositionKey& key) {
  std::lock_guard lock(mutex_);
  auto it = drifts_.find(key);
  return it == drifts_.end() ? std::vector<domain::DriftRecord>{} : it->second;
}

std::uint64_t JsonFileStateStore::lastDriftId() {
  std::lock_guard lock(mutex_);
  return last_drift_id_;
}

// -----------------------------------------------------------------------------
// DCA configs
// -----------------------------------------------------------------------------
void JsonFileStateStore::saveDcaConfig(const domain::PositionKey& key,
                                       const domain::DcaConfig& config) {
  std::lock_guard lock(mutex_);
  dca_configs_[key] = config;
  writeDcaConfigsLocked();
}

std::map<domain::PositionKey, domain::DcaConfig>
JsonFileStateStore::loadDcaConfigs() {
  std::lock_guard lock(mutex_);
  return dca_configs_;
}

void JsonFileStateStore::writeDcaConfigsLocked() {
  nlohmann::json doc = nlohmann::json::object();
  for (const auto& [key, config] : dca_configs_) {
    doc[key.toString()] = nlohmann::json{{"account_id", key.account_id},
                                         {"symbol", key.symbol},
                                         {"config", config}};
  }
  writeAtomically(pathOf(kDcaConfigsFile), doc.dump(2));
}

}  // namespace flatguard
