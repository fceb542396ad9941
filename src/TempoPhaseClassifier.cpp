#include "TempoPhaseClassifier.hpp"

#include <algorithm>
#include <cmath>

double tempo_phase_score(const RepPhase& p, const TempoConfig& cfg) {
  double target = (p.kind == PhaseKind::Concentric) ? cfg.target_concentric_s
                                                    : cfg.target_eccentric_s;
  if (target <= 0.0) return 100.0;

  double deviation = std::fabs(p.duration_s() - target) / target;
  if (deviation <= cfg.tolerance) return 100.0;

  double excess_pct = (deviation - cfg.tolerance) * 100.0;
  return std::max(0.0, 100.0 - cfg.penalty_per_pct * excess_pct);
}

TempoPhaseClassifier::TempoPhaseClassifier(const TempoConfig& cfg) : cfg_(cfg) {}

PhaseKind TempoPhaseClassifier::kind_for(int dir) const {
  bool same = (dir == concentric_dir_);
  return same ? PhaseKind::Concentric : PhaseKind::Eccentric;
}

void TempoPhaseClassifier::open_phase(int64_t t_ms, int dir, bool after_pause) {
  if (concentric_dir_ == 0) {
    // the first movement of the set fixes which direction is concentric
    concentric_dir_ = cfg_.concentric_first ? dir : -dir;
  }
  moving_ = true;
  dir_ = dir;
  current_ = RepPhase{};
  current_.kind = kind_for(dir);
  current_.start_ms = t_ms;
  current_.pause_detected = after_pause;
}

PhaseEvent TempoPhaseClassifier::close_phase(int64_t end_ms) {
  PhaseEvent ev{};
  ev.total_reps = total_reps_;
  moving_ = false;

  current_.end_ms = end_ms;

  // enforce minimum phase length to avoid rapid noise
  if (current_.end_ms - current_.start_ms < cfg_.min_phase_ms) {
    return ev;
  }

  phases_.push_back(current_);
  ev.phase_completed = true;
  ev.phase = current_;

  // one concentric + one eccentric = one rep
  if (++phases_in_rep_ == 2) {
    phases_in_rep_ = 0;
    total_reps_++;
    ev.rep_completed = true;
    ev.total_reps = total_reps_;
  }
  return ev;
}

PhaseEvent TempoPhaseClassifier::update(const SensorSample& s) {
  PhaseEvent ev{};
  ev.total_reps = total_reps_;

  if (!s.motion_avail || s.frozen) return ev;

  // Use rotation around Y axis (bar path on a wrist-worn sensor)
  float g = s.gyro.y;
  float mag = std::fabs(g);

  int64_t dt = (last_t_ >= 0) ? (s.t_ms - last_t_) : 0;
  last_t_ = s.t_ms;

  // 1) Below threshold: "deadband" (near zero velocity) ends any phase
  if (mag <= cfg_.deadband_dps) {
    if (!in_deadband_) {
      in_deadband_ = true;
      deadband_since_ = s.t_ms;
      if (moving_) ev = close_phase(s.t_ms);
    }
    return ev;
  }

  int dir = (g > 0.0f) ? +1 : -1;

  // 2) Leaving the deadband starts a phase; a long enough stop is a pause
  if (in_deadband_) {
    bool after_pause = deadband_since_ < 0 || (s.t_ms - deadband_since_) >= cfg_.pause_ms;
    in_deadband_ = false;
    open_phase(s.t_ms, dir, after_pause);
    return ev;
  }

  // 3) Reversal without passing through the deadband
  if (dir != dir_) {
    ev = close_phase(s.t_ms);
    open_phase(s.t_ms, dir, false);
    return ev;
  }

  // still moving in same direction, accumulate range of motion
  current_.rom_deg += mag * (dt / 1000.0);
  return ev;
}

PhaseEvent TempoPhaseClassifier::finish(int64_t t_ms) {
  PhaseEvent ev{};
  ev.total_reps = total_reps_;
  if (moving_) ev = close_phase(t_ms);
  in_deadband_ = true;
  deadband_since_ = t_ms;
  return ev;
}

void TempoPhaseClassifier::truncate_after(int64_t t_ms) {
  moving_ = false;
  phases_.erase(std::remove_if(phases_.begin(), phases_.end(),
                               [t_ms](const RepPhase& p) { return p.end_ms > t_ms; }),
                phases_.end());

  // recount whole reps from what survived
  int conc = 0, ecc = 0;
  for (const auto& p : phases_) {
    if (p.kind == PhaseKind::Concentric) ++conc; else ++ecc;
  }
  total_reps_ = std::min(conc, ecc);
  phases_in_rep_ = static_cast<int>(phases_.size()) - 2 * total_reps_;
}

boost::optional<double> TempoPhaseClassifier::tempo_score() const {
  if (phases_.empty()) return boost::none;
  double sum = 0.0;
  for (const auto& p : phases_) sum += tempo_phase_score(p, cfg_);
  return sum / phases_.size();
}

std::vector<PhaseSplit> TempoPhaseClassifier::splits() const {
  std::vector<PhaseSplit> out;
  out.reserve(phases_.size());
  for (const auto& p : phases_) {
    PhaseSplit sp;
    sp.kind = p.kind;
    sp.duration_s = p.duration_s();
    sp.target_s = (p.kind == PhaseKind::Concentric) ? cfg_.target_concentric_s
                                                    : cfg_.target_eccentric_s;
    sp.score = tempo_phase_score(p, cfg_);
    out.push_back(sp);
  }
  return out;
}

void TempoPhaseClassifier::reset() {
  phases_.clear();
  in_deadband_ = true;
  deadband_since_ = -1;
  moving_ = false;
  dir_ = 0;
  concentric_dir_ = 0;
  current_ = RepPhase{};
  last_t_ = -1;
  phases_in_rep_ = 0;
  total_reps_ = 0;
}
