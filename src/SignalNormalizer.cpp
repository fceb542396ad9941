#include "SignalNormalizer.hpp"

#include <cmath>
#include <iostream>

float Vec3::norm() const {
  return std::sqrt(x * x + y * y + z * z);
}

void SampleWindow::push(const SensorSample& s) {
  samples_.push_back(s);
  while (samples_.size() > capacity_) samples_.pop_front();
}

size_t SampleWindow::first_at_or_after(int64_t t) const {
  // samples are pushed in time order, so scan back from the newest
  size_t i = samples_.size();
  while (i > 0 && samples_[i - 1].t_ms >= t) --i;
  return i;
}

SignalNormalizer::SignalNormalizer(const NormalizerConfig& cfg)
  : cfg_(cfg), window_(cfg.window_capacity) {}

SensorSample SignalNormalizer::normalize(const SensorFrame& f, bool dropped_before) {
  ++frames_seen_;

  // 1) Low battery: hold the last good sample, do not recompute anything
  if (f.battery_pct < cfg_.low_battery_pct) {
    if (!frozen_) {
      std::cerr << "[normalizer] battery " << f.battery_pct << "% - freezing signal\n";
    }
    frozen_ = true;
    SensorSample held = last_good_ ? *last_good_ : SensorSample{};
    held.t_ms = f.t_ms;
    held.frozen = true;
    last_t_ = f.t_ms;
    return held;
  }
  if (frozen_) {
    std::cerr << "[normalizer] signal resumed\n";
    frozen_ = false;
  }

  SensorSample s;
  s.t_ms = f.t_ms;

  s.hr_avail = f.has_hr && f.hr_bpm > 0.0f;
  if (s.hr_avail) s.hr_bpm = f.hr_bpm;

  s.spo2_avail = f.has_spo2 && f.spo2_pct > 0.0f;
  if (s.spo2_avail) s.spo2_pct = f.spo2_pct;

  s.motion_avail = f.has_motion;
  if (s.motion_avail) {
    motion_seen_ = true;
    s.accel = Vec3{f.ax, f.ay, f.az};
    s.gyro = Vec3{f.gx, f.gy, f.gz};
  }

  // 2) Timing: reordered frames are flagged and kept out of the window
  bool out_of_order = last_t_ >= 0 && f.t_ms <= last_t_;
  bool gap = last_t_ >= 0 && (f.t_ms - last_t_) > cfg_.max_gap_ms;
  s.stale = dropped_before || out_of_order || gap;

  if (out_of_order) return s;

  last_t_ = f.t_ms;
  window_.push(s);
  last_good_ = s;
  return s;
}

void SignalNormalizer::reset() {
  window_.clear();
  last_good_ = boost::none;
  last_t_ = -1;
  frames_seen_ = 0;
  motion_seen_ = false;
  frozen_ = false;
}

void SampleMailbox::post(const SensorFrame& f) {
  std::lock_guard<std::mutex> lock(mu_);
  if (full_) {
    overwritten_ = true;
    ++total_dropped_;
  }
  slot_ = f;
  full_ = true;
}

bool SampleMailbox::take(SensorFrame& out, bool& dropped) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!full_) return false;
  out = slot_;
  dropped = overwritten_;
  full_ = false;
  overwritten_ = false;
  return true;
}

long SampleMailbox::total_dropped() const {
  std::lock_guard<std::mutex> lock(mu_);
  return total_dropped_;
}
