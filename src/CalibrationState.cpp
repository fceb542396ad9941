#include "CalibrationState.hpp"

#include <stdexcept>

using nlohmann::json;

const char* to_string(CalibrationMode m) {
  switch (m) {
    case CalibrationMode::FullCalibration: return "full_calibration";
    case CalibrationMode::RecalibrateFirstSet: return "recalibrate_first_set";
    case CalibrationMode::SingleTweak: return "single_tweak";
    case CalibrationMode::PlateauTest: return "plateau_test";
    case CalibrationMode::Stable: return "stable";
  }
  return "stable";
}

const char* to_string(TrainingParam p) {
  switch (p) {
    case TrainingParam::Sets: return "sets";
    case TrainingParam::Reps: return "reps";
    case TrainingParam::Volume: return "volume";
    case TrainingParam::Tempo: return "tempo";
  }
  return "volume";
}

CalibrationMode calibration_mode_from_string(const std::string& s) {
  for (CalibrationMode m : {CalibrationMode::FullCalibration, CalibrationMode::RecalibrateFirstSet,
                            CalibrationMode::SingleTweak, CalibrationMode::PlateauTest,
                            CalibrationMode::Stable}) {
    if (s == to_string(m)) return m;
  }
  throw std::runtime_error("unknown calibration mode: " + s);
}

TrainingParam training_param_from_string(const std::string& s) {
  for (TrainingParam p : {TrainingParam::Sets, TrainingParam::Reps, TrainingParam::Volume,
                          TrainingParam::Tempo}) {
    if (s == to_string(p)) return p;
  }
  throw std::runtime_error("unknown training parameter: " + s);
}

double TrainingParameters::get(TrainingParam p) const {
  switch (p) {
    case TrainingParam::Sets: return sets;
    case TrainingParam::Reps: return reps;
    case TrainingParam::Volume: return volume_kg;
    case TrainingParam::Tempo: return tempo_s;
  }
  return 0.0;
}

void TrainingParameters::set(TrainingParam p, double v) {
  switch (p) {
    case TrainingParam::Sets: sets = static_cast<int>(v); break;
    case TrainingParam::Reps: reps = static_cast<int>(v); break;
    case TrainingParam::Volume: volume_kg = v; break;
    case TrainingParam::Tempo: tempo_s = v; break;
  }
}

bool operator==(const TrainingParameters& a, const TrainingParameters& b) {
  return changed_parameters(a, b) == 0;
}

bool operator!=(const TrainingParameters& a, const TrainingParameters& b) {
  return !(a == b);
}

int changed_parameters(const TrainingParameters& a, const TrainingParameters& b) {
  int n = 0;
  if (a.sets != b.sets) ++n;
  if (a.reps != b.reps) ++n;
  if (a.volume_kg != b.volume_kg) ++n;
  if (a.tempo_s != b.tempo_s) ++n;
  return n;
}

void to_json(json& j, const TrainingParameters& p) {
  j = json{{"sets", p.sets}, {"reps", p.reps}, {"volume_kg", p.volume_kg}, {"tempo_s", p.tempo_s}};
}

void from_json(const json& j, TrainingParameters& p) {
  TrainingParameters d;
  p.sets = j.value("sets", d.sets);
  p.reps = j.value("reps", d.reps);
  p.volume_kg = j.value("volume_kg", d.volume_kg);
  p.tempo_s = j.value("tempo_s", d.tempo_s);
}

void to_json(json& j, const CalibrationState& s) {
  j = json{
    {"exercise_id", s.exercise_id},
    {"week", s.week},
    {"mode", to_string(s.mode)},
    {"week_mode", to_string(s.week_mode)},
    {"params", s.params},
    {"stable_params", s.stable_params},
    {"target_intensity", s.target_intensity},
    {"strain_ceiling", s.strain_ceiling},
    {"converged", s.converged},
    {"needs_manual_review", s.needs_manual_review},
    {"one_rm_kg", s.one_rm_kg},
    {"calibration_sets", s.calibration_sets},
    {"sign_reversals", s.sign_reversals},
    {"last_error_sign", s.last_error_sign},
    {"sessions_this_week", s.sessions_this_week},
    {"pr_cycle", s.pr_cycle},
  };

  if (s.last_delta) {
    j["last_delta"] = json{{"param", to_string(s.last_delta->param)},
                           {"before", s.last_delta->before},
                           {"after", s.last_delta->after},
                           {"week", s.last_delta->week}};
  }
  if (s.week_param) j["week_param"] = to_string(*s.week_param);
  if (s.pr_prediction) j["pr_prediction"] = *s.pr_prediction;

  json best = json::object();
  for (const auto& kv : s.week_best) best[std::to_string(kv.first)] = kv.second;
  j["week_best"] = best;
}

void from_json(const json& j, CalibrationState& s) {
  s = CalibrationState{};
  s.exercise_id = j.at("exercise_id").get<std::string>();
  s.week = j.value("week", 1);
  s.mode = calibration_mode_from_string(j.value("mode", std::string("full_calibration")));
  s.week_mode = calibration_mode_from_string(j.value("week_mode", std::string(to_string(s.mode))));
  if (j.contains("params")) s.params = j["params"].get<TrainingParameters>();
  if (j.contains("stable_params")) s.stable_params = j["stable_params"].get<TrainingParameters>();
  s.target_intensity = j.value("target_intensity", s.target_intensity);
  s.strain_ceiling = j.value("strain_ceiling", s.strain_ceiling);
  s.converged = j.value("converged", false);
  s.needs_manual_review = j.value("needs_manual_review", false);
  s.one_rm_kg = j.value("one_rm_kg", 0.0);
  s.calibration_sets = j.value("calibration_sets", 0);
  s.sign_reversals = j.value("sign_reversals", 0);
  s.last_error_sign = j.value("last_error_sign", 0);
  s.sessions_this_week = j.value("sessions_this_week", 0);
  s.pr_cycle = j.value("pr_cycle", -1);

  if (j.contains("last_delta")) {
    const json& d = j["last_delta"];
    ParameterDelta delta;
    delta.param = training_param_from_string(d.at("param").get<std::string>());
    delta.before = d.value("before", 0.0);
    delta.after = d.value("after", 0.0);
    delta.week = d.value("week", 0);
    s.last_delta = delta;
  }
  if (j.contains("week_param")) s.week_param = training_param_from_string(j["week_param"].get<std::string>());
  if (j.contains("pr_prediction")) s.pr_prediction = j["pr_prediction"].get<double>();

  if (j.contains("week_best")) {
    for (auto it = j["week_best"].begin(); it != j["week_best"].end(); ++it) {
      s.week_best[std::stoi(it.key())] = it.value().get<double>();
    }
  }
}
