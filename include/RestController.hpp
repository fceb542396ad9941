#pragma once
#include "AnomalyDetector.hpp"
#include "EngineConfig.hpp"

#include <boost/optional.hpp>

#include <cstdint>
#include <deque>

enum class RestState { Idle, Counting, AutoExtending, Suppressed, Complete };

const char* to_string(RestState s);

struct RestPeriod {
  int prior_set_index = -1;
  int planned_s = 0;       // within [min_s, max_s]
  int bonus_s = 0;         // owed by forgotten-set "no" answers
  int target_s = 0;        // planned + bonus + extensions; never decreases
  double actual_s = 0.0;

  bool auto_extended = false;
  bool suppressed_life_pause = false;
  double suppressed_s = 0.0;        // time spent in life pauses
  double genuine_recovery_s = 0.0;  // actual minus suppressed; what calibration reads

  bool finished_early = false;
  int64_t started_ms = 0;
  int64_t ended_ms = -1;
};

// What other components publish for the rest controller to read. Only the
// controller itself mutates rest state.
struct RestInputs {
  int64_t t_ms = 0;
  boost::optional<double> strain;
  bool motion_avail = false;
  float gyro_dps = 0.0f;  // gyro magnitude
};

struct RestUpdate {
  RestState state = RestState::Idle;
  int remaining_s = 0;
  bool extended = false;
  bool life_pause_started = false;
  bool completed = false;
};

// Planned rest from the finished set: scales with the locked intensity,
// goes to the maximum after a high-strain set, clamped to [min_s, max_s].
// recovery_pct is the HR drop since the set ended as a percentage of the
// HR at set end; slow recovery lengthens the rest and fast recovery shortens it.
int plan_rest_seconds(const RestConfig& cfg, double user_intensity,
                      const boost::optional<double>& peak_strain, bool calibrating,
                      const boost::optional<double>& recovery_pct = boost::none);

// HR drop from set_end_bpm to now_bpm in percent of set_end_bpm, capped at 100.
boost::optional<double> hr_recovery_pct(const boost::optional<float>& set_end_bpm,
                                        const boost::optional<float>& now_bpm);

class RestController {
public:
  explicit RestController(const RestConfig& cfg);

  void start(int prior_set_index, int planned_s, int bonus_s, int64_t t_ms);
  RestUpdate tick(const RestInputs& in);

  // athlete moves on before the countdown ends
  RestPeriod finish(int64_t t_ms);

  RestState state() const { return state_; }
  const RestPeriod& period() const { return period_; }
  bool active() const { return state_ != RestState::Idle && state_ != RestState::Complete; }

private:
  void extend(int seconds);
  void complete(int64_t t_ms, bool early);
  void close_life_pause(int64_t t_ms);

  RestConfig cfg_;
  RestState state_ = RestState::Idle;
  RestPeriod period_;
  DebouncedAnomalyDetector life_pause_;

  struct StrainPoint {
    int64_t t_ms;
    double value;
  };
  std::deque<StrainPoint> strain_hist_;
  bool was_high_ = false;
  int extension_total_s_ = 0;
};
