#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

// All tunables in one place. Defaults are the shipped values; a JSON file
// can override any subset (see config/engine.json).

struct NormalizerConfig {
  float low_battery_pct = 10.0f;   // below this the device is frozen
  int64_t max_gap_ms = 1000;       // larger gaps between ticks mark the sample stale
  size_t window_capacity = 256;    // rolling sample window (~10 s @ 25 Hz)
};

struct StrainConfig {
  double resting_hr_bpm = 65.0;            // personal baseline
  double baseline_spo2_pct = 98.0;
  double hr_rise_full_scale_bpm = 60.0;    // +60 bpm over baseline = 100
  double spo2_drop_full_scale_pct = 10.0;  // -10 points = 100
  double recovery_delay_full_scale_ms = 30000.0;
  double recovery_margin_bpm = 10.0;       // "recovered" once HR is within this of baseline
  int64_t window_ms = 3000;                // rolling mean window
};

struct TempoConfig {
  float deadband_dps = 8.0f;        // |gyro| at or below this is "not moving"
  int min_phase_ms = 160;           // shorter swings are treated as noise
  bool concentric_first = true;     // first movement after a pause is concentric
  int64_t pause_ms = 300;           // deadband at least this long counts as a pause
  double target_concentric_s = 1.5;
  double target_eccentric_s = 2.0;
  double tolerance = 0.15;          // +/-15 % band scores full marks
  double penalty_per_pct = 2.0;     // points lost per % beyond the band
};

struct QualityConfig {
  double jerk_scale_g_per_s = 4.0;  // rms jerk giving smoothness 100/e
  double consistency_cv_gain = 2.0;
};

struct IntensityConfig {
  double w_tempo = 0.30;
  double w_smoothness = 0.25;
  double w_consistency = 0.20;
  double w_feedback = 0.15;
  double w_strain = 0.10;

  double feedback_neutral = 75.0;
  double feedback_keep_going = 90.0;
  double feedback_flag = 40.0;
  double easy_killer_factor = 0.875;  // locks at 87.5 % of the pre-feedback score

  int64_t feedback_window_ms = 5000;
};

struct ForgottenSetConfig {
  double erratic_variance_threshold = 2.0;  // (m/s^2)^2 over the erratic window
  int64_t erratic_window_ms = 1000;
  int64_t strain_window_ms = 3000;
  double strain_drop_fraction = 0.10;
  int64_t prompt_timeout_ms = 10000;
  int distraction_bonus_s = 15;
  // glitch onset: first sample outside median +/- max(k * sigma, min band)
  double onset_band_sigma = 3.0;
  double onset_min_band = 0.5;              // m/s^2
  int64_t onset_quiet_ms = 200;             // calm run that ends the backward search
};

struct RestConfig {
  int min_s = 30;
  int max_s = 90;
  double extend_above_strain = 85.0;
  int extension_step_s = 15;
  int max_extension_s = 90;
  float gyro_flat_dps = 5.0f;
  int64_t life_pause_debounce_ms = 2000;
  int64_t strain_fall_window_ms = 2000;
  int64_t hr_recovery_min_ms = 5000;   // HR drop is only read after this long off the bar
};

struct CalibrationConfig {
  double target_intensity = 98.0;
  double strain_ceiling = 88.0;
  double settle_band = 2.0;            // |intensity - target| within this is "settled"
  double first_set_tolerance = 0.05;   // first set of a week only retuned beyond 5 %
  double abort_strain = 95.0;
  int max_calibration_sets = 8;
  int max_sign_reversals = 4;
  double plateau_min_improvement = 2.0;
  int cycle_weeks = 5;
};

struct PlateauConfig {
  double weight_fraction = 0.40;
  double min_weight_fraction = 0.30;
  double max_weight_fraction = 0.50;
  int min_reps = 3;
  int max_reps = 6;
  int min_sets = 2;
  int max_sets = 4;
  double min_tut_s = 30.0;
  double max_tut_s = 60.0;
  double eccentric_share = 0.70;
};

struct EngineConfig {
  NormalizerConfig normalizer;
  StrainConfig strain;
  TempoConfig tempo;
  QualityConfig quality;
  IntensityConfig intensity;
  ForgottenSetConfig forgotten_set;
  RestConfig rest;
  CalibrationConfig calibration;
  PlateauConfig plateau;
};

// Missing keys keep their defaults. Throws std::runtime_error on a
// malformed file or on values that break an invariant (e.g. rest min > max).
EngineConfig engine_config_from_json(const nlohmann::json& j);
EngineConfig load_engine_config(const std::string& path);
