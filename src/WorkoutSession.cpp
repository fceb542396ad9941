#include "WorkoutSession.hpp"
#include "Errors.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace {
  struct ModeNameVisitor : boost::static_visitor<const char*> {
    const char* operator()(const FreeMode&) const { return "free"; }
    const char* operator()(const CalibrationSessionMode& m) const { return to_string(m.mode); }
    const char* operator()(const PlateauSessionMode&) const { return "plateau_test"; }
  };

  // calibration passes want comparable rests between sets
  struct CalibratingVisitor : boost::static_visitor<bool> {
    bool operator()(const FreeMode&) const { return false; }
    bool operator()(const CalibrationSessionMode& m) const {
      return m.mode != CalibrationMode::Stable;
    }
    bool operator()(const PlateauSessionMode&) const { return true; }
  };

  struct SetCompletedVisitor : boost::static_visitor<boost::optional<CalibrationDecision>> {
    SetCompletedVisitor(const std::string& exercise, const SetOutcome& outcome)
      : exercise_(exercise), outcome_(outcome) {}

    boost::optional<CalibrationDecision> operator()(const FreeMode&) const { return boost::none; }
    boost::optional<CalibrationDecision> operator()(const CalibrationSessionMode& m) const {
      return m.engine->on_set_completed(exercise_, outcome_);
    }
    boost::optional<CalibrationDecision> operator()(const PlateauSessionMode& m) const {
      return m.engine->on_set_completed(exercise_, outcome_);
    }

    const std::string& exercise_;
    const SetOutcome& outcome_;
  };

  struct SetBegunVisitor : boost::static_visitor<std::vector<HapticCue>> {
    SetBegunVisitor(const std::string& exercise, int set_index)
      : exercise_(exercise), set_index_(set_index) {}

    std::vector<HapticCue> operator()(const FreeMode&) const { return {}; }
    std::vector<HapticCue> operator()(const CalibrationSessionMode&) const { return {}; }
    std::vector<HapticCue> operator()(const PlateauSessionMode& m) const {
      return m.engine->cues_for_set(exercise_, set_index_);
    }

    const std::string& exercise_;
    int set_index_;
  };

  struct SetAbortedVisitor : boost::static_visitor<void> {
    explicit SetAbortedVisitor(const std::string& exercise) : exercise_(exercise) {}

    void operator()(const FreeMode&) const {}
    void operator()(const CalibrationSessionMode&) const {
      std::cerr << "[session] " << exercise_ << ": aborted set not fed to calibration\n";
    }
    void operator()(const PlateauSessionMode&) const {
      std::cerr << "[session] " << exercise_ << ": aborted plateau set, cues cancelled\n";
    }

    const std::string& exercise_;
  };
}

const char* mode_name(const SessionMode& m) {
  return boost::apply_visitor(ModeNameVisitor(), m);
}

SessionMode session_mode_for(CalibrationEngine& engine, const std::string& exercise) {
  CalibrationMode m = engine.start_session(exercise);
  if (m == CalibrationMode::PlateauTest) return PlateauSessionMode{&engine};
  return CalibrationSessionMode{&engine, m};
}

WorkoutSession::WorkoutSession(const EngineConfig& cfg, const std::string& exercise, SessionMode mode,
                               ICoachingSink& sink)
  : cfg_(cfg),
    exercise_(exercise),
    mode_(std::move(mode)),
    sink_(sink),
    normalizer_(cfg.normalizer),
    strain_(cfg.strain),
    tempo_(cfg.tempo),
    quality_(cfg.quality),
    scorer_(cfg.intensity),
    forgotten_(cfg.forgotten_set),
    rest_(cfg.rest) {
  std::cerr << "[session] " << exercise_ << " started in " << mode_name(mode_) << " mode\n";
}

IntensityComponents WorkoutSession::components(const boost::optional<double>& strain,
                                               bool strain_estimated) const {
  IntensityComponents c;
  if (!normalizer_.degraded()) {
    c.tempo = tempo_.tempo_score();
    c.motion_smoothness = quality_.motion_smoothness();
    c.rep_consistency = quality_.rep_consistency(tempo_.phases());
  }
  c.strain = strain;
  c.strain_estimated = strain && strain_estimated;
  return c;
}

void WorkoutSession::publish_status(bool estimated, bool stale) {
  bool degraded = normalizer_.degraded();
  if (estimated == status_estimated_ && degraded == status_degraded_ && stale == status_stale_) return;
  if (degraded && !status_degraded_) {
    std::cerr << "[session] no motion data, tempo and live intensity disabled\n";
  }
  status_estimated_ = estimated;
  status_degraded_ = degraded;
  status_stale_ = stale;
  sink_.on_status(estimated, degraded, stale);
}

void WorkoutSession::on_frame(const SensorFrame& frame, bool dropped_before) {
  // 1) Normalize and estimate strain
  SensorSample s = normalizer_.normalize(frame, dropped_before);
  last_t_ = s.t_ms;
  if (!s.frozen) last_hr_ = s.hr_avail ? s.hr_bpm : boost::optional<float>();
  const SampleWindow& window = normalizer_.window();
  StrainReading reading = strain_.update(s, window);

  bool wearable = s.hr_avail || s.spo2_avail || (s.frozen && reading.held);
  boost::optional<double> strain;
  if (wearable) strain = reading.value;

  // 2) Set in progress: per-tick analysis and the live estimate
  if (in_set_) {
    if (!s.frozen) {
      if (s.motion_avail) tempo_.update(s);
      quality_.update(s);

      ForgottenSetUpdate fs = forgotten_.update(s, reading, window);
      if (fs.prompt_raised) sink_.on_forgotten_set_prompt(fs.event);
      if (fs.resolved) {
        distraction_ = true;
        sink_.on_forgotten_set_resolved(fs.event);
      }
    }

    if (strain) {
      if (!peak_strain_ || *strain > *peak_strain_) peak_strain_ = strain;
      if (reading.estimated) strain_estimated_ = true;
    }

    IntensityComponents c = components(strain, reading.estimated);
    IntensityScore live = scorer_.score(c);
    publish_status(live.estimated, s.stale || s.frozen);
    if (!normalizer_.degraded()) sink_.on_live_intensity(live, tempo_.total_reps(), s.t_ms);
  } else {
    publish_status(wearable && reading.estimated, s.stale || s.frozen);
  }

  // 3) Feedback window
  if (pending_ && pending_->expire(s.t_ms)) commit(s.t_ms);

  // 4) Rest countdown
  if (rest_.active()) {
    RestInputs in;
    in.t_ms = s.t_ms;
    in.strain = strain;
    in.motion_avail = s.motion_avail && !s.frozen;
    in.gyro_dps = s.gyro.norm();

    RestUpdate u = rest_.tick(in);
    sink_.on_rest_update(u, rest_.period());
    if (u.completed) sink_.on_rest_complete(rest_.period());
  }
}

void WorkoutSession::begin_set(int64_t t_ms, double weight_kg) {
  if (in_set_) throw std::logic_error("set " + std::to_string(set_index_) + " is still running");

  // the athlete moved on: close whatever is still open
  if (pending_) {
    pending_->close(t_ms);
    commit(t_ms);
  }
  if (rest_.active()) finish_rest(t_ms);

  in_set_ = true;
  ++set_index_;
  set_started_ms_ = t_ms;
  weight_kg_ = weight_kg;
  peak_strain_ = boost::none;
  strain_estimated_ = false;
  form_unstable_ = false;
  distraction_ = false;

  tempo_.reset();
  quality_.reset();
  forgotten_.start_set(t_ms);

  sink_.on_set_begun(exercise_, set_index_, t_ms);
  for (const auto& cue : boost::apply_visitor(SetBegunVisitor(exercise_, set_index_), mode_)) {
    sink_.on_haptic_cue(cue);
  }
}

void WorkoutSession::complete_set(int64_t t_ms) {
  if (!in_set_) throw std::logic_error("no set in progress");
  end_set(t_ms, t_ms);
}

void WorkoutSession::end_set(int64_t end_ms, int64_t now_ms) {
  tempo_.finish(end_ms);
  forgotten_.stop();
  in_set_ = false;

  SetRecord draft;
  draft.exercise_id = exercise_;
  draft.set_index = set_index_;
  draft.reps = tempo_.total_reps();
  draft.weight_kg = weight_kg_;
  draft.started_ms = set_started_ms_;
  draft.ended_ms = end_ms;
  draft.distraction_flagged = distraction_;

  double tut_s = 0.0;
  for (const auto& p : tempo_.phases()) tut_s += p.duration_s();

  pending_peak_strain_ = peak_strain_;
  pending_form_unstable_ = form_unstable_;
  pending_tut_s_ = tut_s;
  pending_end_hr_ = last_hr_;
  pending_ = PendingSet(draft, components(peak_strain_, strain_estimated_), scorer_, now_ms,
                        cfg_.intensity.feedback_window_ms);

  sink_.on_set_ended(exercise_, set_index_, end_ms);
}

void WorkoutSession::submit_feedback(Feedback fb, int64_t t_ms) {
  if (!pending_) {
    if (committed_.empty()) throw std::logic_error("no completed set to rate");
    throw SetLockedError("set " + std::to_string(committed_.back().set_index) + " of " +
                         exercise_ + " is locked");
  }
  pending_->apply_feedback(fb, t_ms);
  commit(t_ms);
}

void WorkoutSession::commit(int64_t t_ms) {
  // all or nothing: the record only joins the history once locked
  SetRecord record = pending_->record();
  pending_ = boost::none;
  committed_.push_back(record);
  sink_.on_set_locked(record);

  std::cerr << "[session] set " << record.set_index << " locked at " << record.intensity.trainer
            << " (" << to_string(record.feedback) << ")\n";

  SetOutcome outcome;
  outcome.set_index = record.set_index;
  outcome.intensity = record.intensity.trainer;
  outcome.peak_strain = pending_peak_strain_;
  outcome.form_unstable = pending_form_unstable_;
  outcome.tut_s = pending_tut_s_;

  last_decision_ = boost::apply_visitor(SetCompletedVisitor(exercise_, outcome), mode_);
  if (last_decision_ && last_decision_->safety_stop) {
    sink_.on_safety_stop(exercise_, last_decision_->reason);
  }

  bool calibrating = boost::apply_visitor(CalibratingVisitor(), mode_);
  boost::optional<double> recovery;
  if (t_ms - record.ended_ms >= cfg_.rest.hr_recovery_min_ms) {
    recovery = hr_recovery_pct(pending_end_hr_, last_hr_);
  }
  int planned = plan_rest_seconds(cfg_.rest, record.intensity.user, pending_peak_strain_,
                                  calibrating, recovery);
  rest_.start(record.set_index, planned, forgotten_.take_rest_bonus_s(), t_ms);
}

void WorkoutSession::respond_to_prompt(PromptResponse r, int64_t t_ms) {
  auto ev = forgotten_.respond(r, t_ms);
  if (!ev) return;
  sink_.on_forgotten_set_resolved(*ev);

  if (ev->action == ForgottenSetAction::EndSetAtBoundary) {
    // everything after the last calm sample belongs to the glitch
    tempo_.truncate_after(ev->boundary_ms);
    quality_.truncate_after(ev->boundary_ms);
    if (in_set_) end_set(ev->boundary_ms, t_ms);
  } else {
    distraction_ = true;
  }
}

void WorkoutSession::report_form_instability() {
  if (in_set_) form_unstable_ = true;
}

void WorkoutSession::abort_set(int64_t t_ms) {
  if (!in_set_) return;
  in_set_ = false;
  forgotten_.stop();
  tempo_.reset();
  quality_.reset();
  peak_strain_ = boost::none;

  boost::apply_visitor(SetAbortedVisitor(exercise_), mode_);
  std::cerr << "[session] set " << set_index_ << " aborted at " << t_ms << "ms, nothing recorded\n";
  --set_index_;
}

void WorkoutSession::finish_rest(int64_t t_ms) {
  if (!rest_.active()) return;
  sink_.on_rest_complete(rest_.finish(t_ms));
}

void WorkoutSession::end_session(int64_t t_ms) {
  abort_set(t_ms);
  if (pending_) {
    pending_->close(t_ms);
    commit(t_ms);
  }
  finish_rest(t_ms);
  std::cerr << "[session] " << exercise_ << " ended, " << committed_.size() << " sets\n";
}

nlohmann::json WorkoutSession::history_payload() const {
  return gate_.export_history(committed_);
}
