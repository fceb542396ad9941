#include "MotionQualityScorer.hpp"

#include <algorithm>
#include <cmath>

double coefficient_of_variation(const std::vector<double>& v) {
  if (v.size() < 2) return 0.0;
  double mean = 0.0;
  for (double x : v) mean += x;
  mean /= v.size();
  if (mean <= 0.0) return 0.0;

  double var = 0.0;
  for (double x : v) var += (x - mean) * (x - mean);
  var /= v.size();
  return std::sqrt(var) / mean;
}

MotionQualityScorer::MotionQualityScorer(const QualityConfig& cfg) : cfg_(cfg) {}

void MotionQualityScorer::update(const SensorSample& s) {
  if (!s.motion_avail || s.frozen) {
    has_prev_ = false;
    return;
  }

  // a gap would fake a huge jerk across it; restart differencing here
  if (s.stale) {
    has_prev_ = true;
    prev_accel_ = s.accel;
    prev_t_ = s.t_ms;
    return;
  }

  if (has_prev_ && s.t_ms > prev_t_) {
    double dt = (s.t_ms - prev_t_) / 1000.0;
    double jx = (s.accel.x - prev_accel_.x) / dt;
    double jy = (s.accel.y - prev_accel_.y) / dt;
    double jz = (s.accel.z - prev_accel_.z) / dt;
    jerk_.push_back(JerkPoint{s.t_ms, jx * jx + jy * jy + jz * jz});
  }

  has_prev_ = true;
  prev_accel_ = s.accel;
  prev_t_ = s.t_ms;
}

boost::optional<double> MotionQualityScorer::motion_smoothness() const {
  if (jerk_.empty()) return boost::none;

  double sum = 0.0;
  for (const auto& j : jerk_) sum += j.jerk_sq;
  double rms = std::sqrt(sum / jerk_.size());

  if (cfg_.jerk_scale_g_per_s <= 0.0) return 100.0;
  return 100.0 * std::exp(-rms / cfg_.jerk_scale_g_per_s);
}

boost::optional<double> MotionQualityScorer::rep_consistency(const std::vector<RepPhase>& phases) const {
  if (phases.empty()) return boost::none;

  // eccentric and concentric have different targets, compare like with like
  std::vector<double> cvs;
  for (PhaseKind kind : {PhaseKind::Concentric, PhaseKind::Eccentric}) {
    std::vector<double> durations, roms;
    for (const auto& p : phases) {
      if (p.kind != kind) continue;
      durations.push_back(p.duration_s());
      roms.push_back(p.rom_deg);
    }
    if (durations.size() < 2) continue;
    cvs.push_back(coefficient_of_variation(durations));
    cvs.push_back(coefficient_of_variation(roms));
  }

  if (cvs.empty()) return 100.0;  // a single rep is consistent with itself

  double cv = 0.0;
  for (double c : cvs) cv += c;
  cv /= cvs.size();

  return 100.0 * std::max(0.0, 1.0 - cfg_.consistency_cv_gain * cv);
}

void MotionQualityScorer::truncate_after(int64_t t_ms) {
  jerk_.erase(std::remove_if(jerk_.begin(), jerk_.end(),
                             [t_ms](const JerkPoint& j) { return j.t_ms > t_ms; }),
              jerk_.end());
  has_prev_ = false;
}

void MotionQualityScorer::reset() {
  jerk_.clear();
  has_prev_ = false;
  prev_accel_ = Vec3{};
  prev_t_ = 0;
}
