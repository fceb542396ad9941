#include "ForgottenSetDetector.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

namespace {
  constexpr double kStandardGravity = 9.80665;
  constexpr double kMadToSigma = 1.4826;

  double median(std::vector<double> v) {
    if (v.empty()) return 0.0;
    size_t mid = v.size() / 2;
    std::nth_element(v.begin(), v.begin() + mid, v.end());
    return v[mid];
  }

  AnomalyConfig anomaly_config(const ForgottenSetConfig& cfg) {
    AnomalyConfig a;
    a.debounce_ms = 0;  // the trailing windows already debounce
    a.pending_timeout_ms = cfg.prompt_timeout_ms;
    a.release_on_clear = false;
    return a;
  }
}

const char* to_string(PromptResponse r) {
  switch (r) {
    case PromptResponse::Yes: return "yes";
    case PromptResponse::No: return "no";
    case PromptResponse::Timeout: return "timeout";
  }
  return "timeout";
}

ForgottenSetDetector::ForgottenSetDetector(const ForgottenSetConfig& cfg)
  : cfg_(cfg), detector_(anomaly_config(cfg)) {}

void ForgottenSetDetector::start_set(int64_t set_start_ms) {
  set_start_ms_ = set_start_ms;
  last_calm_ms_ = set_start_ms;
  strain_hist_.clear();
  pending_ = boost::none;
  detector_.arm();
}

void ForgottenSetDetector::stop() {
  detector_.disarm();
  pending_ = boost::none;
  strain_hist_.clear();
}

double ForgottenSetDetector::accel_erraticism(const SampleWindow& w, int64_t from_ms, int64_t to_ms) {
  double sum = 0.0, sum_sq = 0.0;
  int n = 0;
  for (size_t i = w.first_at_or_after(from_ms); i < w.size(); ++i) {
    const SensorSample& s = w[i];
    if (s.t_ms > to_ms) break;
    if (!s.motion_avail) continue;
    double m = s.accel.norm() * kStandardGravity;
    sum += m;
    sum_sq += m * m;
    ++n;
  }
  if (n < 2) return 0.0;
  double mean = sum / n;
  return std::max(0.0, sum_sq / n - mean * mean);
}

ForgottenSetUpdate ForgottenSetDetector::update(const SensorSample& s, const StrainReading& strain,
                                                const SampleWindow& window) {
  ForgottenSetUpdate out;
  if (detector_.state() == AnomalyState::Idle || s.frozen) return out;

  // 1) Trailing strain window
  strain_hist_.push_back(StrainPoint{s.t_ms, strain.value});
  while (!strain_hist_.empty() && strain_hist_.front().t_ms < s.t_ms - cfg_.strain_window_ms) {
    strain_hist_.pop_front();
  }
  double peak = 0.0;
  for (const auto& p : strain_hist_) peak = std::max(peak, p.value);
  double delta = peak - strain.value;
  bool strain_falling = peak > 0.0 && delta > cfg_.strain_drop_fraction * peak;

  // 2) Erratic motion over the trailing erratic window
  double erraticism = accel_erraticism(window, s.t_ms - cfg_.erratic_window_ms, s.t_ms);
  bool erratic = erraticism > cfg_.erratic_variance_threshold;
  if (!erratic && detector_.state() == AnomalyState::Watching) last_calm_ms_ = s.t_ms;

  // 3) State machine; Pending never re-raises
  bool raised = detector_.update(s.t_ms, erratic && strain_falling);
  if (raised) {
    ForgottenSetEvent ev;
    ev.trigger_ms = s.t_ms;
    ev.strain_delta = delta;
    ev.erraticism = erraticism;
    std::pair<int64_t, int64_t> onset = glitch_onset(window, s.t_ms);
    ev.onset_ms = onset.first;
    ev.boundary_ms = onset.second;
    pending_ = ev;
    out.prompt_raised = true;
    out.event = ev;
    std::cerr << "[forgotten-set] prompt at " << s.t_ms << "ms (strain -" << delta
              << ", erraticism " << erraticism << ", onset " << ev.onset_ms << "ms)\n";
    return out;
  }

  if (pending_ && detector_.state() == AnomalyState::Resolved &&
      detector_.resolution() == AnomalyResolution::TimedOut) {
    out.resolved = true;
    out.event = close_pending(PromptResponse::Timeout, s.t_ms);
  }
  return out;
}

std::pair<int64_t, int64_t> ForgottenSetDetector::glitch_onset(const SampleWindow& w,
                                                                int64_t trigger_ms) const {
  int64_t fallback = std::max(last_calm_ms_, set_start_ms_);
  int64_t from_ms = std::max(set_start_ms_, last_calm_ms_ - cfg_.erratic_window_ms);
  size_t lo = w.first_at_or_after(from_ms);

  // 1) Calm band from the window that still read calm: median +/- k * robust sigma
  std::vector<double> calm;
  for (size_t i = lo; i < w.size() && w[i].t_ms <= last_calm_ms_; ++i) {
    if (w[i].motion_avail) calm.push_back(w[i].accel.norm() * kStandardGravity);
  }
  if (calm.size() < 2) return std::make_pair(fallback, fallback);

  double center = median(calm);
  std::vector<double> dev;
  dev.reserve(calm.size());
  for (double m : calm) dev.push_back(std::fabs(m - center));
  double band = std::max(cfg_.onset_min_band, cfg_.onset_band_sigma * kMadToSigma * median(dev));

  // 2) Backward from the trigger until a calm run of onset_quiet_ms
  size_t onset = w.size();
  int64_t quiet_from = -1;
  for (size_t i = w.size(); i-- > lo;) {
    const SensorSample& x = w[i];
    if (x.t_ms > trigger_ms || !x.motion_avail) continue;
    if (std::fabs(x.accel.norm() * kStandardGravity - center) > band) {
      onset = i;
      quiet_from = -1;
    } else {
      if (quiet_from < 0) quiet_from = x.t_ms;
      if (onset < w.size() && quiet_from - x.t_ms >= cfg_.onset_quiet_ms) break;
    }
  }
  if (onset == w.size()) return std::make_pair(fallback, fallback);

  int64_t onset_ms = w[onset].t_ms;
  int64_t boundary = (onset > 0) ? w[onset - 1].t_ms : set_start_ms_;
  return std::make_pair(onset_ms, std::max(boundary, set_start_ms_));
}

boost::optional<ForgottenSetEvent> ForgottenSetDetector::respond(PromptResponse r, int64_t t_ms) {
  if (!pending_ || detector_.state() != AnomalyState::Pending) return boost::none;
  AnomalyResolution res = (r == PromptResponse::Yes) ? AnomalyResolution::Confirmed
                                                     : AnomalyResolution::Dismissed;
  detector_.resolve(res, t_ms);
  return close_pending(r, t_ms);
}

ForgottenSetEvent ForgottenSetDetector::close_pending(PromptResponse r, int64_t t_ms) {
  ForgottenSetEvent ev = *pending_;
  pending_ = boost::none;
  ev.response = r;
  ev.resolved_ms = t_ms;

  if (r == PromptResponse::Yes) {
    // set ends at the boundary; nothing left to watch
    ev.action = ForgottenSetAction::EndSetAtBoundary;
    detector_.disarm();
  } else {
    // "no" and an unanswered prompt both mean: distraction, keep going
    ev.action = ForgottenSetAction::FlagDistraction;
    rest_bonus_s_ += cfg_.distraction_bonus_s;
    strain_hist_.clear();
    last_calm_ms_ = t_ms;
    detector_.arm();
  }

  std::cerr << "[forgotten-set] resolved " << to_string(r) << " at " << t_ms << "ms\n";
  history_.push_back(ev);
  return ev;
}

int ForgottenSetDetector::take_rest_bonus_s() {
  int b = rest_bonus_s_;
  rest_bonus_s_ = 0;
  return b;
}
