#include "RestController.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace {
  AnomalyConfig life_pause_config(const RestConfig& cfg) {
    AnomalyConfig a;
    a.debounce_ms = cfg.life_pause_debounce_ms;
    a.pending_timeout_ms = -1;
    a.release_on_clear = true;
    return a;
  }

  double recovery_factor(double pct) {
    double f = 1.2;             // poor
    if (pct >= 80.0) f = 0.8;   // excellent
    else if (pct >= 60.0) f = 0.9;
    else if (pct >= 40.0) f = 1.0;

    if (pct < 30.0) f *= 1.3;
    else if (pct > 80.0) f *= 0.8;
    return f;
  }
}

const char* to_string(RestState s) {
  switch (s) {
    case RestState::Idle: return "idle";
    case RestState::Counting: return "counting";
    case RestState::AutoExtending: return "auto_extending";
    case RestState::Suppressed: return "suppressed";
    case RestState::Complete: return "complete";
  }
  return "idle";
}

boost::optional<double> hr_recovery_pct(const boost::optional<float>& set_end_bpm,
                                        const boost::optional<float>& now_bpm) {
  if (!set_end_bpm || !now_bpm || *set_end_bpm <= 0.0f) return boost::none;
  double drop = static_cast<double>(*set_end_bpm) - *now_bpm;
  return std::min(100.0, drop / *set_end_bpm * 100.0);
}

int plan_rest_seconds(const RestConfig& cfg, double user_intensity,
                      const boost::optional<double>& peak_strain, bool calibrating,
                      const boost::optional<double>& recovery_pct) {
  double frac = std::max(0.0, std::min(1.0, user_intensity / 100.0));
  double planned = cfg.min_s + frac * (cfg.max_s - cfg.min_s);

  if (peak_strain && *peak_strain > cfg.extend_above_strain) planned = cfg.max_s;
  if (recovery_pct) planned *= recovery_factor(*recovery_pct);
  // calibration needs comparable sets, so never rest less than the midpoint
  if (calibrating) planned = std::max(planned, (cfg.min_s + cfg.max_s) / 2.0);

  int s = static_cast<int>(std::lround(planned));
  return std::max(cfg.min_s, std::min(cfg.max_s, s));
}

RestController::RestController(const RestConfig& cfg)
  : cfg_(cfg), life_pause_(life_pause_config(cfg)) {}

void RestController::start(int prior_set_index, int planned_s, int bonus_s, int64_t t_ms) {
  period_ = RestPeriod{};
  period_.prior_set_index = prior_set_index;
  period_.planned_s = std::max(cfg_.min_s, std::min(cfg_.max_s, planned_s));
  period_.bonus_s = std::max(0, bonus_s);
  period_.target_s = period_.planned_s + period_.bonus_s;
  period_.started_ms = t_ms;

  strain_hist_.clear();
  was_high_ = false;
  extension_total_s_ = 0;
  life_pause_.arm();
  state_ = RestState::Counting;

  std::cerr << "[rest] start " << period_.planned_s << "s";
  if (period_.bonus_s > 0) std::cerr << " +" << period_.bonus_s << "s";
  std::cerr << "\n";
}

void RestController::extend(int seconds) {
  int room = cfg_.max_extension_s - extension_total_s_;
  int step = std::min(seconds, room);
  if (step <= 0) return;
  extension_total_s_ += step;
  period_.target_s += step;
  period_.auto_extended = true;
  std::cerr << "[rest] extended to " << period_.target_s << "s\n";
}

void RestController::close_life_pause(int64_t t_ms) {
  int64_t since = life_pause_.condition_since();
  if (since >= 0 && t_ms > since) period_.suppressed_s += (t_ms - since) / 1000.0;
}

void RestController::complete(int64_t t_ms, bool early) {
  if (life_pause_.state() == AnomalyState::Pending) close_life_pause(t_ms);
  life_pause_.disarm();

  period_.ended_ms = t_ms;
  period_.actual_s = (t_ms - period_.started_ms) / 1000.0;
  period_.genuine_recovery_s = std::max(0.0, period_.actual_s - period_.suppressed_s);
  period_.finished_early = early;
  state_ = RestState::Complete;
}

RestUpdate RestController::tick(const RestInputs& in) {
  RestUpdate out;
  out.state = state_;
  if (!active()) return out;

  int64_t elapsed_ms = in.t_ms - period_.started_ms;

  // 1) Life pause: gyro flat while strain keeps falling
  bool falling = false;
  if (in.strain) {
    strain_hist_.push_back(StrainPoint{in.t_ms, *in.strain});
    while (strain_hist_.size() > 1 && strain_hist_.front().t_ms < in.t_ms - cfg_.strain_fall_window_ms) {
      strain_hist_.pop_front();
    }
    falling = strain_hist_.size() > 1 && *in.strain < strain_hist_.front().value;
  }
  bool flat = in.motion_avail && in.gyro_dps <= cfg_.gyro_flat_dps;

  if (life_pause_.update(in.t_ms, flat && falling)) {
    period_.suppressed_life_pause = true;
    out.life_pause_started = true;
    std::cerr << "[rest] life pause at " << elapsed_ms / 1000.0 << "s, suppressing\n";
  }
  if (life_pause_.state() == AnomalyState::Resolved) {
    close_life_pause(life_pause_.resolved_at());
    life_pause_.arm();
  }
  bool suppressed = life_pause_.state() == AnomalyState::Pending;
  // a streak still inside its debounce is booked as pause time if it confirms
  bool pause_forming = life_pause_.state() == AnomalyState::Watching &&
                       life_pause_.condition_since() >= 0;

  // 2) High strain extends the countdown, never while suppressed or about to be
  bool high = !suppressed && !pause_forming && in.strain && *in.strain > cfg_.extend_above_strain;
  if (high) {
    int64_t remaining_ms = period_.target_s * 1000LL - elapsed_ms;
    if (!was_high_ || remaining_ms < cfg_.extension_step_s * 1000LL) {
      int before = period_.target_s;
      extend(cfg_.extension_step_s);
      out.extended = period_.target_s > before;
    }
  }
  was_high_ = high;

  if (suppressed) {
    state_ = RestState::Suppressed;
  } else if (high) {
    state_ = RestState::AutoExtending;
  } else {
    state_ = RestState::Counting;
  }

  // 3) Countdown; the timer keeps running through suppression
  if (elapsed_ms >= period_.target_s * 1000LL) {
    complete(in.t_ms, false);
    out.completed = true;
  }

  out.state = state_;
  int64_t remaining_ms = std::max<int64_t>(0, period_.target_s * 1000LL - elapsed_ms);
  out.remaining_s = static_cast<int>((remaining_ms + 999) / 1000);
  return out;
}

RestPeriod RestController::finish(int64_t t_ms) {
  if (active()) complete(t_ms, true);
  return period_;
}
