#pragma once
#include "CalibrationEngine.hpp"
#include "CoachingEvents.hpp"
#include "EngineConfig.hpp"
#include "ForgottenSetDetector.hpp"
#include "IntensityScorer.hpp"
#include "MotionQualityScorer.hpp"
#include "PrivacyGate.hpp"
#include "RestController.hpp"
#include "SensorFrame.hpp"
#include "SignalNormalizer.hpp"
#include "StrainEstimator.hpp"
#include "TempoPhaseClassifier.hpp"

#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

// Session modes. The engine is owned by the caller and outlives the session.
struct FreeMode {};

struct CalibrationSessionMode {
  CalibrationEngine* engine = nullptr;
  CalibrationMode mode = CalibrationMode::Stable;
};

struct PlateauSessionMode {
  CalibrationEngine* engine = nullptr;
};

using SessionMode = boost::variant<FreeMode, CalibrationSessionMode, PlateauSessionMode>;

const char* mode_name(const SessionMode& m);

// Mode for a program exercise: asks the engine which kind of session this is.
SessionMode session_mode_for(CalibrationEngine& engine, const std::string& exercise);

// One active workout on one exercise. Created at session start, dropped at
// the end; owns every per-session component and drives them from the tick
// stream. Single-threaded: callers feed frames and user input from one loop.
class WorkoutSession {
public:
  WorkoutSession(const EngineConfig& cfg, const std::string& exercise, SessionMode mode,
                 ICoachingSink& sink);

  // Tick pipeline: normalize, then strain, tempo, quality and forgotten-set
  // detection, live intensity, pending feedback timeout and the rest timer.
  void on_frame(const SensorFrame& frame, bool dropped_before = false);

  void begin_set(int64_t t_ms, double weight_kg);
  // Ends the set and opens its feedback window. The record is committed
  // when feedback arrives or the window closes; rest starts then.
  void complete_set(int64_t t_ms);
  void submit_feedback(Feedback fb, int64_t t_ms);
  void respond_to_prompt(PromptResponse r, int64_t t_ms);
  // Pose/trainer input: the current set lost form.
  void report_form_instability();
  // Athlete stopped mid-set: the draft is discarded, nothing is recorded.
  void abort_set(int64_t t_ms);
  // Athlete skips the rest of the countdown.
  void finish_rest(int64_t t_ms);
  // Workout over: an open set is aborted, open feedback locks neutral.
  void end_session(int64_t t_ms);

  bool in_set() const { return in_set_; }
  int sets_started() const { return set_index_; }
  bool degraded() const { return normalizer_.degraded(); }
  const boost::optional<PendingSet>& pending() const { return pending_; }
  const std::vector<SetRecord>& committed() const { return committed_; }
  const RestController& rest() const { return rest_; }
  const ForgottenSetDetector& forgotten_sets() const { return forgotten_; }
  const SessionMode& mode() const { return mode_; }
  const boost::optional<CalibrationDecision>& last_decision() const { return last_decision_; }

  // trainer view of the current or last set
  std::vector<PhaseSplit> splits() const { return tempo_.splits(); }

  // what the sync layer may receive for this session
  nlohmann::json history_payload() const;

private:
  IntensityComponents components(const boost::optional<double>& strain, bool strain_estimated) const;
  void end_set(int64_t end_ms, int64_t now_ms);
  void commit(int64_t t_ms);
  void publish_status(bool estimated, bool stale);

  EngineConfig cfg_;
  std::string exercise_;
  SessionMode mode_;
  ICoachingSink& sink_;
  PrivacyGate gate_;

  SignalNormalizer normalizer_;
  StrainEstimator strain_;
  TempoPhaseClassifier tempo_;
  MotionQualityScorer quality_;
  IntensityScorer scorer_;
  ForgottenSetDetector forgotten_;
  RestController rest_;

  // set in progress
  bool in_set_ = false;
  int set_index_ = 0;
  int64_t set_started_ms_ = 0;
  double weight_kg_ = 0.0;
  boost::optional<double> peak_strain_;
  bool strain_estimated_ = false;
  bool form_unstable_ = false;
  bool distraction_ = false;

  // finished set awaiting feedback
  boost::optional<PendingSet> pending_;
  boost::optional<double> pending_peak_strain_;
  bool pending_form_unstable_ = false;
  double pending_tut_s_ = 0.0;
  boost::optional<float> pending_end_hr_;

  boost::optional<float> last_hr_;

  std::vector<SetRecord> committed_;
  boost::optional<CalibrationDecision> last_decision_;

  bool status_estimated_ = false;
  bool status_degraded_ = false;
  bool status_stale_ = false;
  int64_t last_t_ = 0;
};
