#include "StrainEstimator.hpp"

#include <algorithm>

namespace {
  constexpr double kWeightHr = 0.4;
  constexpr double kWeightSpo2 = 0.3;
  constexpr double kWeightRecovery = 0.3;

  constexpr double kGreenMax = 85.0;
  constexpr double kYellowMax = 95.0;
}

double strain_modifier(double strain) {
  if (strain <= kGreenMax) return 1.0;
  if (strain <= kYellowMax) return 0.95;
  return 0.85;
}

StrainZone strain_zone(double strain) {
  if (strain <= kGreenMax) return StrainZone::Green;
  if (strain <= kYellowMax) return StrainZone::Yellow;
  return StrainZone::Red;
}

StrainEstimator::StrainEstimator(const StrainConfig& cfg) : cfg_(cfg) {}

double StrainEstimator::normalize(double amount, double full_scale) const {
  if (full_scale <= 0.0) return 0.0;
  return std::max(0.0, std::min(100.0, amount / full_scale * 100.0));
}

StrainReading StrainEstimator::update(const SensorSample& s, const SampleWindow& window) {
  // Frozen device: hold the last value, no recompute until the signal resumes
  if (s.frozen && last_) {
    StrainReading held = *last_;
    held.t_ms = s.t_ms;
    held.held = true;
    return held;
  }

  // 1) Rolling means over the trailing window
  double hr_sum = 0.0, spo2_sum = 0.0;
  int hr_n = 0, spo2_n = 0;
  for (size_t i = window.first_at_or_after(s.t_ms - cfg_.window_ms); i < window.size(); ++i) {
    const SensorSample& w = window[i];
    if (w.t_ms > s.t_ms) break;
    if (w.hr_avail && w.hr_bpm) { hr_sum += *w.hr_bpm; ++hr_n; }
    if (w.spo2_avail && w.spo2_pct) { spo2_sum += *w.spo2_pct; ++spo2_n; }
  }

  StrainReading r;
  r.t_ms = s.t_ms;
  r.stale = s.stale;

  // 2) Terms; a missing channel contributes a neutral 0
  if (hr_n > 0) {
    double mean_hr = hr_sum / hr_n;
    r.hr_rise = normalize(mean_hr - cfg_.resting_hr_bpm, cfg_.hr_rise_full_scale_bpm);

    if (mean_hr > cfg_.resting_hr_bpm + cfg_.recovery_margin_bpm) {
      if (elevated_since_ < 0) elevated_since_ = s.t_ms;
      r.recovery_delay = normalize(static_cast<double>(s.t_ms - elevated_since_),
                                   cfg_.recovery_delay_full_scale_ms);
    } else {
      elevated_since_ = -1;
    }
  } else {
    r.estimated = true;
  }

  if (spo2_n > 0) {
    r.spo2_drop = normalize(cfg_.baseline_spo2_pct - spo2_sum / spo2_n,
                            cfg_.spo2_drop_full_scale_pct);
  } else {
    r.estimated = true;
  }

  r.value = kWeightHr * r.hr_rise + kWeightSpo2 * r.spo2_drop + kWeightRecovery * r.recovery_delay;

  last_ = r;
  return r;
}

void StrainEstimator::reset() {
  last_ = boost::none;
  elevated_since_ = -1;
}
