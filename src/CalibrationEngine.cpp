#include "CalibrationEngine.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {
  // weeks 2-4 rotate through these, one per week
  const TrainingParam kTweakOrder[] = {
    TrainingParam::Reps, TrainingParam::Volume, TrainingParam::Tempo, TrainingParam::Sets
  };
  constexpr int kTweakOrderSize = 4;

  constexpr double kVolumeStep = 0.05;      // +/-5 % of the load
  constexpr double kTempoStep_s = 0.5;
  constexpr double kCoarseError = 10.0;     // beyond this, full calibration moves load
  constexpr double kMaxVolumeJump = 0.15;

  double round_to_half_kg(double kg) {
    return std::round(kg * 2.0) / 2.0;
  }

  bool allowed(CalibrationMode from, CalibrationMode to) {
    if (from == to) return true;
    switch (from) {
      case CalibrationMode::FullCalibration:
        return to == CalibrationMode::SingleTweak || to == CalibrationMode::Stable;
      case CalibrationMode::SingleTweak:
        return to == CalibrationMode::RecalibrateFirstSet || to == CalibrationMode::PlateauTest ||
               to == CalibrationMode::Stable;
      case CalibrationMode::RecalibrateFirstSet:
        return to == CalibrationMode::SingleTweak || to == CalibrationMode::Stable;
      case CalibrationMode::PlateauTest:
        return to == CalibrationMode::Stable;
      case CalibrationMode::Stable:
        return to == CalibrationMode::RecalibrateFirstSet || to == CalibrationMode::SingleTweak ||
               to == CalibrationMode::PlateauTest;
    }
    return false;
  }
}

const char* to_string(CalibrationAction a) {
  switch (a) {
    case CalibrationAction::None: return "none";
    case CalibrationAction::Adjusted: return "adjusted";
    case CalibrationAction::Settled: return "settled";
    case CalibrationAction::RolledBack: return "rolled_back";
    case CalibrationAction::ManualReview: return "manual_review";
    case CalibrationAction::GuardrailAbort: return "guardrail_abort";
    case CalibrationAction::PlateauComplete: return "plateau_complete";
  }
  return "none";
}

CalibrationEngine::CalibrationEngine(const CalibrationConfig& cfg, const PlateauConfig& plateau,
                                     IProgramStore& store, const std::string& user)
  : cfg_(cfg), plateau_cfg_(plateau), store_(store), user_(user) {}

std::mutex& CalibrationEngine::exercise_mutex(const std::string& exercise) {
  std::lock_guard<std::mutex> lock(registry_mu_);
  auto& slot = exercise_mu_[exercise];
  if (!slot) slot.reset(new std::mutex());
  return *slot;
}

CalibrationState CalibrationEngine::load(const std::string& exercise) const {
  auto s = store_.latest(user_, exercise);
  if (!s) throw std::runtime_error("no calibration state for exercise " + exercise);
  return *s;
}

void CalibrationEngine::persist(const CalibrationState& s) {
  store_.save(ProgramKey{user_, s.exercise_id, s.week}, s);
}

int CalibrationEngine::cycle_week(int week) const {
  return ((week - 1) % cfg_.cycle_weeks) + 1;
}

void CalibrationEngine::transition(CalibrationState& s, CalibrationMode to) const {
  if (!allowed(s.mode, to)) {
    throw std::logic_error(std::string("calibration mode ") + to_string(s.mode) + " -> " +
                           to_string(to) + " is not allowed for " + s.exercise_id);
  }
  s.mode = to;
}

ParameterDelta CalibrationEngine::step(CalibrationState& s, TrainingParam p, int direction) const {
  ParameterDelta d;
  d.param = p;
  d.before = s.params.get(p);
  d.week = s.week;

  double v = d.before;
  switch (p) {
    case TrainingParam::Sets:
      v = std::max(1, std::min(6, s.params.sets + direction));
      break;
    case TrainingParam::Reps:
      v = std::max(1, std::min(20, s.params.reps + direction));
      break;
    case TrainingParam::Volume: {
      double next = round_to_half_kg(d.before * (1.0 + direction * kVolumeStep));
      if (next == d.before) next = d.before + 0.5 * direction;
      v = std::max(0.5, next);
      break;
    }
    case TrainingParam::Tempo:
      v = std::max(1.0, std::min(10.0, s.params.tempo_s + direction * kTempoStep_s));
      break;
  }

  s.params.set(p, v);
  d.after = s.params.get(p);
  if (d.after != d.before) s.last_delta = d;
  return d;
}

CalibrationState CalibrationEngine::create(const std::string& exercise, const TrainingParameters& seed,
                                           double one_rm_kg) {
  CalibrationState s;
  s.exercise_id = exercise;
  s.week = 1;
  s.mode = CalibrationMode::FullCalibration;
  s.week_mode = CalibrationMode::FullCalibration;
  s.params = seed;
  s.stable_params = seed;
  s.target_intensity = cfg_.target_intensity;
  s.strain_ceiling = cfg_.strain_ceiling;
  s.one_rm_kg = one_rm_kg > 0.0 ? one_rm_kg : estimate_one_rm(seed.volume_kg, seed.reps);

  std::cerr << "[calibration] " << exercise << ": new exercise, full calibration\n";
  return s;
}

void CalibrationEngine::plan_week(CalibrationState& s, const DeviceCapabilities& caps) {
  int cw = cycle_week(s.week);

  if (s.needs_manual_review) {
    // hold everything until a trainer has looked at it
    transition(s, CalibrationMode::Stable);
    s.week_mode = CalibrationMode::Stable;
    return;
  }

  if (cw >= 2 && cw <= 4) {
    auto prev = s.week_best.find(s.week - 1);
    int direction = (prev != s.week_best.end() &&
                     prev->second > s.target_intensity + cfg_.settle_band) ? -1 : +1;

    // exactly one parameter per week; skip ones pinned at a bound
    int first = cw - 2;
    for (int i = 0; i < kTweakOrderSize; ++i) {
      TrainingParam p = kTweakOrder[(first + i) % kTweakOrderSize];
      ParameterDelta d = step(s, p, direction);
      if (d.after != d.before) {
        s.week_param = p;
        std::cerr << "[calibration] " << s.exercise_id << " week " << s.week << ": "
                  << to_string(p) << " " << d.before << " -> " << d.after << "\n";
        break;
      }
    }
    transition(s, CalibrationMode::SingleTweak);
    s.week_mode = CalibrationMode::SingleTweak;
    return;
  }

  if (cw == cfg_.cycle_weeks && cfg_.cycle_weeks >= 5) {
    auto w2 = s.week_best.find(s.week - 3);
    auto w4 = s.week_best.find(s.week - 1);
    bool plateau = w2 != s.week_best.end() && w4 != s.week_best.end() &&
                   (w4->second - w2->second) < cfg_.plateau_min_improvement;

    if (plateau && caps.plateau_gate()) {
      PlateauTestSession session;
      session.guardrails = make_plateau_guardrails(plateau_cfg_, s.params, s.one_rm_kg);
      auto violations = guardrail_violations(plateau_cfg_, session.guardrails);
      if (violations.empty()) {
        {
          std::lock_guard<std::mutex> lock(registry_mu_);
          plateau_[s.exercise_id] = session;
        }
        s.params = plateau_parameters(session.guardrails);
        transition(s, CalibrationMode::PlateauTest);
        s.week_mode = CalibrationMode::PlateauTest;
        std::cerr << "[calibration] " << s.exercise_id << " week " << s.week
                  << ": plateau test at " << session.guardrails.weight_kg << "kg\n";
        return;
      }
      std::cerr << "[calibration] " << s.exercise_id << ": plateau test refused ("
                << violations.front() << ")\n";
    } else if (plateau) {
      std::cerr << "[calibration] " << s.exercise_id << ": plateau, but device gate not met\n";
    }
  }

  transition(s, CalibrationMode::Stable);
  s.week_mode = CalibrationMode::Stable;
}

CalibrationState CalibrationEngine::start_week(const std::string& exercise, const DeviceCapabilities& caps,
                                               const TrainingParameters& seed, double one_rm_kg) {
  std::unique_lock<std::mutex> lock(exercise_mutex(exercise), std::try_to_lock);
  if (!lock.owns_lock()) {
    throw std::runtime_error("weekly pass for " + exercise + " already in flight");
  }

  auto existing = store_.latest(user_, exercise);
  if (!existing) {
    CalibrationState s = create(exercise, seed, one_rm_kg);
    persist(s);
    return s;
  }

  CalibrationState s = *existing;
  // a week that finished outside full calibration/plateau without a
  // rollback becomes the new known-good point
  if (s.mode == CalibrationMode::SingleTweak || s.mode == CalibrationMode::Stable ||
      (s.mode == CalibrationMode::FullCalibration && s.converged)) {
    if (!s.needs_manual_review) s.stable_params = s.params;
  }
  if (s.mode == CalibrationMode::PlateauTest) {
    // the experiment is over with the week; back to the program
    s.params = s.stable_params;
  }
  {
    std::lock_guard<std::mutex> reg(registry_mu_);
    plateau_.erase(exercise);
  }

  s.week += 1;
  s.sessions_this_week = 0;
  s.sets_this_session = 0;
  s.week_param = boost::none;
  if (s.mode == CalibrationMode::PlateauTest) transition(s, CalibrationMode::Stable);
  if (s.mode == CalibrationMode::RecalibrateFirstSet) transition(s, s.week_mode);

  plan_week(s, caps);
  persist(s);
  return s;
}

CalibrationMode CalibrationEngine::start_session(const std::string& exercise) {
  std::lock_guard<std::mutex> lock(exercise_mutex(exercise));
  CalibrationState s = load(exercise);

  s.sessions_this_week += 1;
  s.sets_this_session = 0;

  bool first_of_week = s.sessions_this_week == 1;
  if (first_of_week && s.week >= 2 &&
      (s.week_mode == CalibrationMode::SingleTweak || s.week_mode == CalibrationMode::Stable)) {
    transition(s, CalibrationMode::RecalibrateFirstSet);
  } else if (s.mode == CalibrationMode::RecalibrateFirstSet) {
    transition(s, s.week_mode);
  }

  persist(s);
  return s.mode;
}

CalibrationDecision CalibrationEngine::roll_back(CalibrationState& s, CalibrationAction action,
                                                 const std::string& reason) {
  s.params = s.stable_params;

  CalibrationDecision d;
  d.action = action;
  d.reason = reason;
  d.safety_stop = action == CalibrationAction::GuardrailAbort;

  if (s.mode == CalibrationMode::PlateauTest) {
    std::lock_guard<std::mutex> lock(registry_mu_);
    auto it = plateau_.find(s.exercise_id);
    if (it != plateau_.end()) it->second.abort_reason = reason;
  }
  if (action == CalibrationAction::ManualReview || s.mode == CalibrationMode::PlateauTest) {
    transition(s, CalibrationMode::Stable);
    s.week_mode = CalibrationMode::Stable;
  }
  if (action == CalibrationAction::ManualReview) s.needs_manual_review = true;

  std::cerr << "[calibration] " << s.exercise_id << ": " << to_string(action) << " (" << reason
            << "), back to stable parameters\n";
  return d;
}

CalibrationDecision CalibrationEngine::full_calibration_step(CalibrationState& s, const SetOutcome& o) {
  CalibrationDecision d;
  if (s.converged) return d;

  s.calibration_sets += 1;
  double error = s.target_intensity - o.intensity;
  int sign = (error > 0.0) ? 1 : -1;

  // strain over the ceiling wins over everything else: back off the load
  if (o.peak_strain && *o.peak_strain > s.strain_ceiling) {
    d.delta = step(s, TrainingParam::Volume, -1);
    d.action = CalibrationAction::Adjusted;
    d.reason = "strain above ceiling";
  } else if (std::fabs(error) <= cfg_.settle_band) {
    s.converged = true;
    s.stable_params = s.params;
    s.one_rm_kg = std::max(s.one_rm_kg, estimate_one_rm(s.params.volume_kg, s.params.reps));
    d.action = CalibrationAction::Settled;
    std::cerr << "[calibration] " << s.exercise_id << ": settled after " << s.calibration_sets
              << " sets\n";
    return d;
  } else {
    if (s.last_error_sign != 0 && sign != s.last_error_sign) s.sign_reversals += 1;
    s.last_error_sign = sign;

    if (s.sign_reversals < cfg_.max_sign_reversals) {
      if (std::fabs(error) > kCoarseError) {
        double jump = std::max(-kMaxVolumeJump, std::min(kMaxVolumeJump, error / 100.0));
        ParameterDelta pd;
        pd.param = TrainingParam::Volume;
        pd.before = s.params.volume_kg;
        pd.week = s.week;
        s.params.volume_kg = std::max(0.5, round_to_half_kg(pd.before * (1.0 + jump)));
        pd.after = s.params.volume_kg;
        s.last_delta = pd;
        d.delta = pd;
      } else {
        d.delta = step(s, TrainingParam::Reps, sign);
        if (d.delta->after == d.delta->before) d.delta = step(s, TrainingParam::Tempo, sign);
      }
      d.action = CalibrationAction::Adjusted;
    }
  }

  // bounded: oscillating or never settling falls back and asks for a human
  if (s.sign_reversals >= cfg_.max_sign_reversals || s.calibration_sets >= cfg_.max_calibration_sets) {
    std::ostringstream why;
    why << "no convergence after " << s.calibration_sets << " sets, "
        << s.sign_reversals << " reversals";
    return roll_back(s, CalibrationAction::ManualReview, why.str());
  }
  return d;
}

CalibrationDecision CalibrationEngine::first_set_step(CalibrationState& s, const SetOutcome& o) {
  CalibrationDecision d;
  if (s.sets_this_session == 1 && !s.needs_manual_review) {
    double deviation = std::fabs(o.intensity - s.target_intensity) / s.target_intensity;
    if (deviation > cfg_.first_set_tolerance) {
      // in tweak weeks only the week's parameter may move
      TrainingParam p = s.week_param ? *s.week_param : TrainingParam::Volume;
      int direction = (o.intensity < s.target_intensity) ? +1 : -1;
      d.delta = step(s, p, direction);
      d.action = CalibrationAction::Adjusted;
      d.reason = "first set off target";
    }
  }
  transition(s, s.week_mode);
  return d;
}

CalibrationDecision CalibrationEngine::plateau_step(CalibrationState& s) {
  CalibrationDecision d;
  std::lock_guard<std::mutex> lock(registry_mu_);
  auto it = plateau_.find(s.exercise_id);
  if (it == plateau_.end()) return d;

  PlateauTestSession& session = it->second;
  session.sets_done += 1;
  if (session.sets_done >= session.guardrails.sets) {
    session.completed = true;
    s.params = s.stable_params;
    d.action = CalibrationAction::PlateauComplete;
    std::cerr << "[calibration] " << s.exercise_id << ": plateau test complete\n";
  } else {
    d.cues = plateau_cue_schedule(session.guardrails, session.sets_done);
  }
  return d;
}

CalibrationDecision CalibrationEngine::on_set_completed(const std::string& exercise, const SetOutcome& o) {
  std::lock_guard<std::mutex> lock(exercise_mutex(exercise));
  CalibrationState s = load(exercise);

  s.sets_this_session += 1;
  auto best = s.week_best.find(s.week);
  if (best == s.week_best.end() || o.intensity > best->second) s.week_best[s.week] = o.intensity;

  CalibrationDecision d;
  bool guarded = s.mode != CalibrationMode::Stable;
  bool strain_abort = o.peak_strain && *o.peak_strain > cfg_.abort_strain;

  if (guarded && (strain_abort || o.form_unstable)) {
    d = roll_back(s, CalibrationAction::GuardrailAbort,
                  strain_abort ? "strain above abort limit" : "form instability");
  } else {
    switch (s.mode) {
      case CalibrationMode::FullCalibration: d = full_calibration_step(s, o); break;
      case CalibrationMode::RecalibrateFirstSet: d = first_set_step(s, o); break;
      case CalibrationMode::PlateauTest: d = plateau_step(s); break;
      case CalibrationMode::SingleTweak:
      case CalibrationMode::Stable:
        break;
    }
  }

  d.mode = s.mode;
  d.next = s.params;
  persist(s);
  return d;
}

boost::optional<double> CalibrationEngine::predict_pr(const std::string& exercise, Role role) {
  if (role != Role::Trainer) return boost::none;

  std::lock_guard<std::mutex> lock(exercise_mutex(exercise));
  CalibrationState s = load(exercise);

  int cycle = (s.week - 1) / cfg_.cycle_weeks;
  if (s.pr_cycle == cycle && s.pr_prediction) return s.pr_prediction;

  // Epley on the stable working set, nudged by this cycle's trend
  int first_week = cycle * cfg_.cycle_weeks + 1;
  auto lo = s.week_best.lower_bound(first_week);
  double trend = 0.0;
  if (lo != s.week_best.end()) {
    double first = lo->second;
    double last = s.week_best.rbegin()->second;
    trend = std::max(-0.1, std::min(0.1, (last - first) / 100.0));
  }
  double base = std::max(s.one_rm_kg, estimate_one_rm(s.stable_params.volume_kg, s.stable_params.reps));
  s.pr_prediction = round_to_half_kg(base * (1.0 + trend));
  s.pr_cycle = cycle;
  pr_computations_++;

  persist(s);
  return s.pr_prediction;
}

void CalibrationEngine::clear_manual_review(const std::string& exercise) {
  std::lock_guard<std::mutex> lock(exercise_mutex(exercise));
  CalibrationState s = load(exercise);
  s.needs_manual_review = false;
  persist(s);
}

boost::optional<CalibrationState> CalibrationEngine::snapshot(const std::string& exercise) const {
  return store_.latest(user_, exercise);
}

boost::optional<PlateauTestSession> CalibrationEngine::plateau_session(const std::string& exercise) const {
  std::lock_guard<std::mutex> lock(registry_mu_);
  auto it = plateau_.find(exercise);
  if (it == plateau_.end()) return boost::none;
  return it->second;
}

std::vector<HapticCue> CalibrationEngine::cues_for_set(const std::string& exercise, int set_index) const {
  std::lock_guard<std::mutex> lock(registry_mu_);
  auto it = plateau_.find(exercise);
  if (it == plateau_.end() || it->second.completed || it->second.abort_reason) return {};
  return plateau_cue_schedule(it->second.guardrails, set_index);
}
