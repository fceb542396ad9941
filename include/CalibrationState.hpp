#pragma once
#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

#include <map>
#include <string>

enum class CalibrationMode {
  FullCalibration,      // new exercise, week 1: tune after every set
  RecalibrateFirstSet,  // first set of a week's first session
  SingleTweak,          // weeks 2-4: one parameter per week
  PlateauTest,          // guarded tempo experiment
  Stable
};

enum class TrainingParam { Sets, Reps, Volume, Tempo };

const char* to_string(CalibrationMode m);
const char* to_string(TrainingParam p);

struct TrainingParameters {
  int sets = 3;
  int reps = 10;
  double volume_kg = 20.0;  // working load per rep
  double tempo_s = 3.5;     // seconds per rep (eccentric + concentric)

  double get(TrainingParam p) const;
  void set(TrainingParam p, double v);
};

bool operator==(const TrainingParameters& a, const TrainingParameters& b);
bool operator!=(const TrainingParameters& a, const TrainingParameters& b);

// number of fields that differ between two parameter sets
int changed_parameters(const TrainingParameters& a, const TrainingParameters& b);

struct ParameterDelta {
  TrainingParam param = TrainingParam::Volume;
  double before = 0.0;
  double after = 0.0;
  int week = 0;
};

struct CalibrationState {
  std::string exercise_id;
  int week = 1;  // weeks since the exercise entered the program, from 1
  CalibrationMode mode = CalibrationMode::FullCalibration;
  CalibrationMode week_mode = CalibrationMode::FullCalibration;

  TrainingParameters params;
  TrainingParameters stable_params;  // rollback target

  double target_intensity = 98.0;
  double strain_ceiling = 88.0;
  boost::optional<ParameterDelta> last_delta;
  boost::optional<TrainingParam> week_param;  // the one parameter this week may touch

  bool converged = false;
  bool needs_manual_review = false;
  double one_rm_kg = 0.0;

  // full-calibration bookkeeping
  int calibration_sets = 0;
  int sign_reversals = 0;
  int last_error_sign = 0;

  int sessions_this_week = 0;
  int sets_this_session = 0;
  std::map<int, double> week_best;  // best trainer intensity per week

  boost::optional<double> pr_prediction;
  int pr_cycle = -1;
};

// snapshot form shared by the program store and the sync payload
void to_json(nlohmann::json& j, const TrainingParameters& p);
void from_json(const nlohmann::json& j, TrainingParameters& p);
void to_json(nlohmann::json& j, const CalibrationState& s);
void from_json(const nlohmann::json& j, CalibrationState& s);

CalibrationMode calibration_mode_from_string(const std::string& s);
TrainingParam training_param_from_string(const std::string& s);
