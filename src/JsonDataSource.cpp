#include "JsonDataSource.hpp"
#include "FrameJson.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

using nlohmann::json;

JsonDataSource::JsonDataSource(const std::string& path) : path_(path) {
  std::ifstream f(path);
  if (!f.is_open()) throw std::runtime_error("Could not open JSON file: " + path);

  json j;
  f >> j;
  if (!j.is_array()) throw std::runtime_error("JSON must be an array of frames");

  frames_.reserve(j.size());
  int64_t last_t = -1;
  for (const auto& item : j) {
    SensorFrame fr = frame_from_json(item);
    // recordings are replayed in capture order; reject obviously broken files
    if (fr.t_ms < last_t) {
      throw std::runtime_error("frame timestamps go backwards in " + path);
    }
    last_t = fr.t_ms;
    frames_.push_back(fr);
  }
}

bool JsonDataSource::next(SensorFrame& out) {
  if (idx_ >= frames_.size()) return false;
  out = frames_[idx_++];
  return true;
}

std::string JsonDataSource::describe() const {
  return "replay:" + path_;
}
