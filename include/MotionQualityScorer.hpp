#pragma once
#include "EngineConfig.hpp"
#include "SignalNormalizer.hpp"
#include "TempoPhaseClassifier.hpp"

#include <boost/optional.hpp>

#include <vector>

// Sub-scores in [0, 100]. Both are deterministic and monotonic: smoother
// motion or more even phases never score lower.
//   motionSmoothness = 100 * exp(-rms_jerk / jerk_scale)
//   repConsistency   = 100 * max(0, 1 - gain * cv), cv = mean of the
//                      per-kind coefficients of variation of phase
//                      duration and range of motion
class MotionQualityScorer {
public:
  explicit MotionQualityScorer(const QualityConfig& cfg);

  // feed every tick of the set
  void update(const SensorSample& s);

  boost::optional<double> motion_smoothness() const;
  boost::optional<double> rep_consistency(const std::vector<RepPhase>& phases) const;

  // discard jerk samples after a forgotten-set boundary
  void truncate_after(int64_t t_ms);

  void reset();

private:
  struct JerkPoint {
    int64_t t_ms;
    double jerk_sq;
  };

  QualityConfig cfg_;
  std::vector<JerkPoint> jerk_;
  bool has_prev_ = false;
  Vec3 prev_accel_;
  int64_t prev_t_ = 0;
};

// coefficient of variation (stddev / mean); 0 for fewer than two values
double coefficient_of_variation(const std::vector<double>& v);
