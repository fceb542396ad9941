#pragma once
#include "SensorFrame.hpp"

#include <nlohmann/json.hpp>

// Map one JSON object to a SensorFrame. Expected shape (one per line on the
// serial link, or one array element in a recording):
// {"t_ms":0,"accel_g":{"x":0.01,"y":-0.02,"z":1.00},"gyro_dps":{"x":0.3,"y":-0.1,"z":0.2},
//  "hr_bpm":128,"spo2_pct":97,"battery_pct":64}
// Missing hr/spo2 keys (or null) mark the channel unavailable; missing both
// motion blocks marks motion unavailable.
SensorFrame frame_from_json(const nlohmann::json& j);
