#pragma once
#include "CalibrationState.hpp"
#include "EngineConfig.hpp"
#include "PlateauTest.hpp"
#include "ProgramStore.hpp"

#include <boost/optional.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct DeviceCapabilities {
  bool wearable = false;
  bool headphones = false;

  // plateau tests need strain monitoring and an audible/haptic cue channel
  bool plateau_gate() const { return wearable && headphones; }
};

enum class Role { Athlete, Trainer };

// What the engine learns from one locked set.
struct SetOutcome {
  int set_index = 0;
  double intensity = 0.0;              // trainer (uncapped) score
  boost::optional<double> peak_strain;
  bool form_unstable = false;
  double tut_s = 0.0;
};

enum class CalibrationAction {
  None,
  Adjusted,
  Settled,
  RolledBack,
  ManualReview,     // divergence: rolled back and flagged, athlete sees nothing
  GuardrailAbort,   // strain/form: rolled back and surfaced as a safety stop
  PlateauComplete
};

const char* to_string(CalibrationAction a);

struct CalibrationDecision {
  CalibrationAction action = CalibrationAction::None;
  CalibrationMode mode = CalibrationMode::Stable;
  TrainingParameters next;
  boost::optional<ParameterDelta> delta;
  bool safety_stop = false;
  std::string reason;
  std::vector<HapticCue> cues;  // plateau mode: cues for the next set
};

// Per-exercise weekly control loop. All operations on one exercise are
// serialized; different exercises proceed independently.
class CalibrationEngine {
public:
  CalibrationEngine(const CalibrationConfig& cfg, const PlateauConfig& plateau,
                    IProgramStore& store, const std::string& user);

  // Weekly batch pass. The first call for an exercise creates it in week 1
  // (full calibration) from `seed`; each later call advances one week.
  CalibrationState start_week(const std::string& exercise, const DeviceCapabilities& caps,
                              const TrainingParameters& seed = TrainingParameters{},
                              double one_rm_kg = 0.0);

  // Mode for the session about to start.
  CalibrationMode start_session(const std::string& exercise);

  CalibrationDecision on_set_completed(const std::string& exercise, const SetOutcome& outcome);

  // At most one computation per cycle; athletes never see it.
  boost::optional<double> predict_pr(const std::string& exercise, Role role);

  // Trainer acknowledged a manual-review flag.
  void clear_manual_review(const std::string& exercise);

  boost::optional<CalibrationState> snapshot(const std::string& exercise) const;
  boost::optional<PlateauTestSession> plateau_session(const std::string& exercise) const;
  std::vector<HapticCue> cues_for_set(const std::string& exercise, int set_index) const;

  int pr_computations() const { return pr_computations_.load(); }

private:
  std::mutex& exercise_mutex(const std::string& exercise);
  CalibrationState load(const std::string& exercise) const;
  void persist(const CalibrationState& s);

  void transition(CalibrationState& s, CalibrationMode to) const;
  ParameterDelta step(CalibrationState& s, TrainingParam p, int direction) const;
  int cycle_week(int week) const;

  CalibrationState create(const std::string& exercise, const TrainingParameters& seed, double one_rm_kg);
  void plan_week(CalibrationState& s, const DeviceCapabilities& caps);

  CalibrationDecision full_calibration_step(CalibrationState& s, const SetOutcome& o);
  CalibrationDecision first_set_step(CalibrationState& s, const SetOutcome& o);
  CalibrationDecision plateau_step(CalibrationState& s);
  CalibrationDecision roll_back(CalibrationState& s, CalibrationAction action,
                                const std::string& reason);

  CalibrationConfig cfg_;
  PlateauConfig plateau_cfg_;
  IProgramStore& store_;
  std::string user_;

  mutable std::mutex registry_mu_;  // guards the two maps below
  std::map<std::string, std::unique_ptr<std::mutex>> exercise_mu_;
  std::map<std::string, PlateauTestSession> plateau_;

  std::atomic<int> pr_computations_{0};
};
