#include "EngineConfig.hpp"

#include <fstream>
#include <stdexcept>

using nlohmann::json;

namespace {

// value() on a missing section would throw; treat it as empty instead
const json& section(const json& j, const char* key) {
  static const json empty = json::object();
  if (!j.contains(key)) return empty;
  const json& s = j[key];
  if (!s.is_object()) throw std::runtime_error(std::string("config section must be an object: ") + key);
  return s;
}

void validate(const EngineConfig& c) {
  if (c.rest.min_s <= 0 || c.rest.min_s > c.rest.max_s) {
    throw std::runtime_error("config: rest.min_s must be positive and <= rest.max_s");
  }
  if (c.intensity.easy_killer_factor < 0.85 || c.intensity.easy_killer_factor > 0.90) {
    throw std::runtime_error("config: intensity.easy_killer_factor must be within [0.85, 0.90]");
  }
  if (c.tempo.tolerance < 0.0 || c.tempo.penalty_per_pct <= 0.0) {
    throw std::runtime_error("config: tempo tolerance/penalty out of range");
  }
  if (c.plateau.min_reps > c.plateau.max_reps || c.plateau.min_sets > c.plateau.max_sets) {
    throw std::runtime_error("config: plateau rep/set bounds inverted");
  }
  if (c.calibration.max_calibration_sets < 1) {
    throw std::runtime_error("config: calibration.max_calibration_sets must be >= 1");
  }
  if (c.calibration.cycle_weeks < 1) {
    throw std::runtime_error("config: calibration.cycle_weeks must be >= 1");
  }
}

}  // namespace

EngineConfig engine_config_from_json(const json& j) {
  if (!j.is_object()) throw std::runtime_error("config root must be an object");

  EngineConfig c;

  const json& n = section(j, "normalizer");
  c.normalizer.low_battery_pct = n.value("low_battery_pct", c.normalizer.low_battery_pct);
  c.normalizer.max_gap_ms = n.value("max_gap_ms", c.normalizer.max_gap_ms);
  c.normalizer.window_capacity = n.value("window_capacity", c.normalizer.window_capacity);

  const json& s = section(j, "strain");
  c.strain.resting_hr_bpm = s.value("resting_hr_bpm", c.strain.resting_hr_bpm);
  c.strain.baseline_spo2_pct = s.value("baseline_spo2_pct", c.strain.baseline_spo2_pct);
  c.strain.hr_rise_full_scale_bpm = s.value("hr_rise_full_scale_bpm", c.strain.hr_rise_full_scale_bpm);
  c.strain.spo2_drop_full_scale_pct = s.value("spo2_drop_full_scale_pct", c.strain.spo2_drop_full_scale_pct);
  c.strain.recovery_delay_full_scale_ms = s.value("recovery_delay_full_scale_ms", c.strain.recovery_delay_full_scale_ms);
  c.strain.recovery_margin_bpm = s.value("recovery_margin_bpm", c.strain.recovery_margin_bpm);
  c.strain.window_ms = s.value("window_ms", c.strain.window_ms);

  const json& t = section(j, "tempo");
  c.tempo.deadband_dps = t.value("deadband_dps", c.tempo.deadband_dps);
  c.tempo.min_phase_ms = t.value("min_phase_ms", c.tempo.min_phase_ms);
  c.tempo.concentric_first = t.value("concentric_first", c.tempo.concentric_first);
  c.tempo.pause_ms = t.value("pause_ms", c.tempo.pause_ms);
  c.tempo.target_concentric_s = t.value("target_concentric_s", c.tempo.target_concentric_s);
  c.tempo.target_eccentric_s = t.value("target_eccentric_s", c.tempo.target_eccentric_s);
  c.tempo.tolerance = t.value("tolerance", c.tempo.tolerance);
  c.tempo.penalty_per_pct = t.value("penalty_per_pct", c.tempo.penalty_per_pct);

  const json& q = section(j, "quality");
  c.quality.jerk_scale_g_per_s = q.value("jerk_scale_g_per_s", c.quality.jerk_scale_g_per_s);
  c.quality.consistency_cv_gain = q.value("consistency_cv_gain", c.quality.consistency_cv_gain);

  const json& i = section(j, "intensity");
  c.intensity.w_tempo = i.value("w_tempo", c.intensity.w_tempo);
  c.intensity.w_smoothness = i.value("w_smoothness", c.intensity.w_smoothness);
  c.intensity.w_consistency = i.value("w_consistency", c.intensity.w_consistency);
  c.intensity.w_feedback = i.value("w_feedback", c.intensity.w_feedback);
  c.intensity.w_strain = i.value("w_strain", c.intensity.w_strain);
  c.intensity.feedback_neutral = i.value("feedback_neutral", c.intensity.feedback_neutral);
  c.intensity.feedback_keep_going = i.value("feedback_keep_going", c.intensity.feedback_keep_going);
  c.intensity.feedback_flag = i.value("feedback_flag", c.intensity.feedback_flag);
  c.intensity.easy_killer_factor = i.value("easy_killer_factor", c.intensity.easy_killer_factor);
  c.intensity.feedback_window_ms = i.value("feedback_window_ms", c.intensity.feedback_window_ms);

  const json& f = section(j, "forgotten_set");
  c.forgotten_set.erratic_variance_threshold = f.value("erratic_variance_threshold", c.forgotten_set.erratic_variance_threshold);
  c.forgotten_set.erratic_window_ms = f.value("erratic_window_ms", c.forgotten_set.erratic_window_ms);
  c.forgotten_set.strain_window_ms = f.value("strain_window_ms", c.forgotten_set.strain_window_ms);
  c.forgotten_set.strain_drop_fraction = f.value("strain_drop_fraction", c.forgotten_set.strain_drop_fraction);
  c.forgotten_set.prompt_timeout_ms = f.value("prompt_timeout_ms", c.forgotten_set.prompt_timeout_ms);
  c.forgotten_set.distraction_bonus_s = f.value("distraction_bonus_s", c.forgotten_set.distraction_bonus_s);
  c.forgotten_set.onset_band_sigma = f.value("onset_band_sigma", c.forgotten_set.onset_band_sigma);
  c.forgotten_set.onset_min_band = f.value("onset_min_band", c.forgotten_set.onset_min_band);
  c.forgotten_set.onset_quiet_ms = f.value("onset_quiet_ms", c.forgotten_set.onset_quiet_ms);

  const json& r = section(j, "rest");
  c.rest.min_s = r.value("min_s", c.rest.min_s);
  c.rest.max_s = r.value("max_s", c.rest.max_s);
  c.rest.extend_above_strain = r.value("extend_above_strain", c.rest.extend_above_strain);
  c.rest.extension_step_s = r.value("extension_step_s", c.rest.extension_step_s);
  c.rest.max_extension_s = r.value("max_extension_s", c.rest.max_extension_s);
  c.rest.gyro_flat_dps = r.value("gyro_flat_dps", c.rest.gyro_flat_dps);
  c.rest.life_pause_debounce_ms = r.value("life_pause_debounce_ms", c.rest.life_pause_debounce_ms);
  c.rest.strain_fall_window_ms = r.value("strain_fall_window_ms", c.rest.strain_fall_window_ms);
  c.rest.hr_recovery_min_ms = r.value("hr_recovery_min_ms", c.rest.hr_recovery_min_ms);

  const json& cal = section(j, "calibration");
  c.calibration.target_intensity = cal.value("target_intensity", c.calibration.target_intensity);
  c.calibration.strain_ceiling = cal.value("strain_ceiling", c.calibration.strain_ceiling);
  c.calibration.settle_band = cal.value("settle_band", c.calibration.settle_band);
  c.calibration.first_set_tolerance = cal.value("first_set_tolerance", c.calibration.first_set_tolerance);
  c.calibration.abort_strain = cal.value("abort_strain", c.calibration.abort_strain);
  c.calibration.max_calibration_sets = cal.value("max_calibration_sets", c.calibration.max_calibration_sets);
  c.calibration.max_sign_reversals = cal.value("max_sign_reversals", c.calibration.max_sign_reversals);
  c.calibration.plateau_min_improvement = cal.value("plateau_min_improvement", c.calibration.plateau_min_improvement);
  c.calibration.cycle_weeks = cal.value("cycle_weeks", c.calibration.cycle_weeks);

  const json& p = section(j, "plateau");
  c.plateau.weight_fraction = p.value("weight_fraction", c.plateau.weight_fraction);
  c.plateau.min_weight_fraction = p.value("min_weight_fraction", c.plateau.min_weight_fraction);
  c.plateau.max_weight_fraction = p.value("max_weight_fraction", c.plateau.max_weight_fraction);
  c.plateau.min_reps = p.value("min_reps", c.plateau.min_reps);
  c.plateau.max_reps = p.value("max_reps", c.plateau.max_reps);
  c.plateau.min_sets = p.value("min_sets", c.plateau.min_sets);
  c.plateau.max_sets = p.value("max_sets", c.plateau.max_sets);
  c.plateau.min_tut_s = p.value("min_tut_s", c.plateau.min_tut_s);
  c.plateau.max_tut_s = p.value("max_tut_s", c.plateau.max_tut_s);
  c.plateau.eccentric_share = p.value("eccentric_share", c.plateau.eccentric_share);

  validate(c);
  return c;
}

EngineConfig load_engine_config(const std::string& path) {
  std::ifstream f(path);
  if (!f.is_open()) throw std::runtime_error("Could not open config file: " + path);

  json j;
  try {
    f >> j;
  } catch (const json::parse_error& e) {
    throw std::runtime_error("config " + path + " is not valid JSON: " + e.what());
  }
  return engine_config_from_json(j);
}
