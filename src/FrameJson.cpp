#include "FrameJson.hpp"

using nlohmann::json;

namespace {

bool has_number(const json& j, const char* key) {
  return j.contains(key) && j[key].is_number();
}

}  // namespace

SensorFrame frame_from_json(const json& j) {
  SensorFrame fr;
  fr.t_ms = j.value("t_ms", static_cast<int64_t>(0));

  bool motion = false;
  if (j.contains("accel_g")) {
    const auto& a = j["accel_g"];
    fr.ax = a.value("x", 0.0f);
    fr.ay = a.value("y", 0.0f);
    fr.az = a.value("z", 0.0f);
    motion = true;
  }

  if (j.contains("gyro_dps")) {
    const auto& g = j["gyro_dps"];
    fr.gx = g.value("x", 0.0f);
    fr.gy = g.value("y", 0.0f);
    fr.gz = g.value("z", 0.0f);
    motion = true;
  }
  fr.has_motion = motion;

  if (has_number(j, "hr_bpm")) {
    fr.hr_bpm = j["hr_bpm"].get<float>();
    fr.has_hr = true;
  }
  if (has_number(j, "spo2_pct")) {
    fr.spo2_pct = j["spo2_pct"].get<float>();
    fr.has_spo2 = true;
  }
  fr.battery_pct = j.value("battery_pct", 100.0f);

  return fr;
}
