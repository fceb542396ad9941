#pragma once
#include "EngineConfig.hpp"

#include <boost/optional.hpp>

#include <cstdint>
#include <string>

// Post-set difficulty rating from the athlete.
enum class Feedback { None, Neutral, KeepGoing, Challenge, EasyKiller, Flag };

const char* to_string(Feedback fb);
// accepts "neutral", "keep going", "challenge", "easy killer", "flag"
boost::optional<Feedback> feedback_from_string(const std::string& s);

// Inputs to one score. An empty optional is an unavailable term and is
// dropped from the weighted sum (the remaining weights are renormalized).
struct IntensityComponents {
  boost::optional<double> tempo;
  boost::optional<double> motion_smoothness;
  boost::optional<double> rep_consistency;
  boost::optional<double> strain;   // peak strain of the set; none without a wearable
  bool strain_estimated = false;    // wearable present but a channel missing
};

struct IntensityScore {
  double trainer = 0.0;   // uncapped
  double user = 0.0;      // min(trainer, 100)
  bool estimated = false;

  double feedback_term = 0.0;
  double strain_modifier = 1.0;

  int user_percent() const;
};

class IntensityScorer {
public:
  explicit IntensityScorer(const IntensityConfig& cfg);

  // 0.30*tempo + 0.25*smoothness + 0.20*consistency + 0.15*feedback
  // + 0.10*(100*strainModifier)
  IntensityScore score(const IntensityComponents& c, Feedback fb = Feedback::None) const;

  // Locked value after the athlete answers: "challenge" pins 100, "easy
  // killer" takes easy_killer_factor of the pre-feedback score, the rest
  // rescore with their feedback term.
  IntensityScore apply_feedback(const IntensityScore& pre, const IntensityComponents& c,
                                Feedback fb) const;

  double feedback_term(Feedback fb) const;

private:
  IntensityConfig cfg_;
};

// One completed set. Built as a draft, editable until its feedback window
// closes, then locked.
struct SetRecord {
  std::string exercise_id;
  int set_index = 0;
  int reps = 0;
  double weight_kg = 0.0;

  boost::optional<double> tempo_score;
  boost::optional<double> motion_smoothness;
  boost::optional<double> rep_consistency;

  Feedback feedback = Feedback::None;
  double strain_modifier = 1.0;
  IntensityScore intensity;

  int64_t started_ms = 0;
  int64_t ended_ms = 0;
  int64_t locked_ms = -1;

  bool distraction_flagged = false;
  bool locked = false;
};

// The brief post-set window in which feedback may still change a record.
class PendingSet {
public:
  PendingSet(SetRecord draft, const IntensityComponents& components,
             const IntensityScorer& scorer, int64_t opened_ms, int64_t window_ms);

  // applies and locks; throws SetLockedError once locked
  void apply_feedback(Feedback fb, int64_t t_ms);

  // locks with neutral feedback once the window has passed; true if it locked now
  bool expire(int64_t now_ms);
  // locks with neutral feedback right away (next set started early)
  void close(int64_t t_ms);

  bool locked() const { return record_.locked; }
  int64_t deadline_ms() const { return deadline_ms_; }
  const SetRecord& record() const { return record_; }
  const IntensityScore& pre_feedback() const { return pre_feedback_; }

private:
  void lock(int64_t t_ms);

  SetRecord record_;
  IntensityComponents components_;
  const IntensityScorer* scorer_;
  IntensityScore pre_feedback_;
  int64_t deadline_ms_;
};
