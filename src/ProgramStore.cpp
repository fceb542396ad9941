#include "ProgramStore.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <stdexcept>

using nlohmann::json;

boost::optional<CalibrationState> InMemoryProgramStore::load(const ProgramKey& key) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return boost::none;
  return it->second;
}

void InMemoryProgramStore::save(const ProgramKey& key, const CalibrationState& state) {
  std::lock_guard<std::mutex> lock(mu_);
  entries_[key] = state;
}

boost::optional<CalibrationState> InMemoryProgramStore::latest(const std::string& user,
                                                               const std::string& exercise) const {
  std::lock_guard<std::mutex> lock(mu_);
  boost::optional<CalibrationState> best;
  int best_week = -1;
  for (const auto& kv : entries_) {
    if (kv.first.user != user || kv.first.exercise != exercise) continue;
    if (kv.first.week > best_week) {
      best_week = kv.first.week;
      best = kv.second;
    }
  }
  return best;
}

size_t InMemoryProgramStore::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

JsonFileProgramStore::JsonFileProgramStore(const std::string& path) : path_(path) {
  std::ifstream f(path);
  if (!f.is_open()) return;  // first run, nothing stored yet

  json j;
  f >> j;
  if (!j.is_array()) throw std::runtime_error("program store must be a JSON array: " + path);

  for (const auto& item : j) {
    ProgramKey key;
    key.user = item.at("user").get<std::string>();
    key.exercise = item.at("exercise").get<std::string>();
    key.week = item.at("week").get<int>();
    entries_[key] = item.at("state").get<CalibrationState>();
  }
  std::cerr << "[store] loaded " << entries_.size() << " entries from " << path << "\n";
}

void JsonFileProgramStore::save(const ProgramKey& key, const CalibrationState& state) {
  InMemoryProgramStore::save(key, state);
  flush();
}

void JsonFileProgramStore::flush() const {
  json out = json::array();
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& kv : entries_) {
      out.push_back(json{{"user", kv.first.user},
                         {"exercise", kv.first.exercise},
                         {"week", kv.first.week},
                         {"state", kv.second}});
    }
  }

  std::ofstream f(path_, std::ios::trunc);
  if (!f.is_open()) throw std::runtime_error("Could not write program store: " + path_);
  f << out.dump(2) << "\n";
}
