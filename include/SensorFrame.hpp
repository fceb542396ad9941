#pragma once
#include <cstdint>

// One normalized callback from the wearable / phone, before the
// normalizer has checked availability or battery state.
struct SensorFrame {
  int64_t t_ms = 0;
  float ax = 0, ay = 0, az = 0;   // accel in g
  float gx = 0, gy = 0, gz = 0;   // gyro in deg/s

  float hr_bpm = 0;               // heart rate, only meaningful if has_hr
  float spo2_pct = 0;             // SpO2 %, only meaningful if has_spo2
  float battery_pct = 100;

  bool has_hr = false;
  bool has_spo2 = false;
  bool has_motion = true;
};
