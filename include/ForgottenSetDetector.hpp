#pragma once
#include "AnomalyDetector.hpp"
#include "EngineConfig.hpp"
#include "SignalNormalizer.hpp"
#include "StrainEstimator.hpp"

#include <boost/optional.hpp>

#include <cstdint>
#include <deque>
#include <utility>
#include <vector>

enum class PromptResponse { Yes, No, Timeout };
enum class ForgottenSetAction { None, EndSetAtBoundary, FlagDistraction };

struct ForgottenSetEvent {
  int64_t trigger_ms = 0;
  double strain_delta = 0.0;   // fall from the trailing-window max
  double erraticism = 0.0;     // accel magnitude variance, (m/s^2)^2
  int64_t onset_ms = 0;        // first sample of the erratic streak
  int64_t boundary_ms = 0;     // last calm sample before the glitch
  boost::optional<PromptResponse> response;
  ForgottenSetAction action = ForgottenSetAction::None;
  int64_t resolved_ms = -1;
};

struct ForgottenSetUpdate {
  bool prompt_raised = false;  // surface "Think you ended that?"
  bool resolved = false;       // a pending prompt timed out this tick
  ForgottenSetEvent event;
};

const char* to_string(PromptResponse r);

// Watches an in-progress set for "ended but never confirmed": erratic
// accelerometer motion together with strain falling more than 10 % inside
// a trailing 3 s window.
class ForgottenSetDetector {
public:
  explicit ForgottenSetDetector(const ForgottenSetConfig& cfg);

  void start_set(int64_t set_start_ms);
  void stop();

  ForgottenSetUpdate update(const SensorSample& s, const StrainReading& strain,
                            const SampleWindow& window);

  // Answer the pending prompt. Returns the resolved event, or none when no
  // prompt is pending (late taps after a timeout are ignored).
  boost::optional<ForgottenSetEvent> respond(PromptResponse r, int64_t t_ms);

  AnomalyState state() const { return detector_.state(); }
  const boost::optional<ForgottenSetEvent>& pending() const { return pending_; }
  const std::vector<ForgottenSetEvent>& history() const { return history_; }

  // seconds owed to the next rest period by "no"/timeout answers
  int take_rest_bonus_s();

  static double accel_erraticism(const SampleWindow& w, int64_t from_ms, int64_t to_ms);

private:
  // Walks back from the trigger to the first sample of the erratic streak.
  // Returns (onset, boundary); the boundary is the sample just before it.
  std::pair<int64_t, int64_t> glitch_onset(const SampleWindow& w, int64_t trigger_ms) const;
  ForgottenSetEvent close_pending(PromptResponse r, int64_t t_ms);

  ForgottenSetConfig cfg_;
  DebouncedAnomalyDetector detector_;

  struct StrainPoint {
    int64_t t_ms;
    double value;
  };
  std::deque<StrainPoint> strain_hist_;

  int64_t set_start_ms_ = 0;
  int64_t last_calm_ms_ = -1;
  boost::optional<ForgottenSetEvent> pending_;
  std::vector<ForgottenSetEvent> history_;
  int rest_bonus_s_ = 0;
};
