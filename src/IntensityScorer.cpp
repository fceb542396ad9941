#include "IntensityScorer.hpp"
#include "Errors.hpp"
#include "StrainEstimator.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

const char* to_string(Feedback fb) {
  switch (fb) {
    case Feedback::None: return "none";
    case Feedback::Neutral: return "neutral";
    case Feedback::KeepGoing: return "keep going";
    case Feedback::Challenge: return "challenge";
    case Feedback::EasyKiller: return "easy killer";
    case Feedback::Flag: return "flag";
  }
  return "none";
}

boost::optional<Feedback> feedback_from_string(const std::string& s) {
  if (s == "neutral") return Feedback::Neutral;
  if (s == "keep going") return Feedback::KeepGoing;
  if (s == "challenge") return Feedback::Challenge;
  if (s == "easy killer") return Feedback::EasyKiller;
  if (s == "flag") return Feedback::Flag;
  return boost::none;
}

int IntensityScore::user_percent() const {
  return static_cast<int>(std::floor(user));
}

IntensityScorer::IntensityScorer(const IntensityConfig& cfg) : cfg_(cfg) {}

double IntensityScorer::feedback_term(Feedback fb) const {
  switch (fb) {
    case Feedback::KeepGoing: return cfg_.feedback_keep_going;
    case Feedback::Flag: return cfg_.feedback_flag;
    default: return cfg_.feedback_neutral;
  }
}

IntensityScore IntensityScorer::score(const IntensityComponents& c, Feedback fb) const {
  IntensityScore out;
  out.feedback_term = feedback_term(fb);
  out.strain_modifier = c.strain ? strain_modifier(*c.strain) : 1.0;

  bool all = c.tempo && c.motion_smoothness && c.rep_consistency && c.strain;

  if (all) {
    // every term present: the plain documented sum, no renormalization
    out.trainer = cfg_.w_tempo * *c.tempo +
                  cfg_.w_smoothness * *c.motion_smoothness +
                  cfg_.w_consistency * *c.rep_consistency +
                  cfg_.w_feedback * out.feedback_term +
                  cfg_.w_strain * (100.0 * out.strain_modifier);
  } else {
    double sum = cfg_.w_feedback * out.feedback_term;
    double weights = cfg_.w_feedback;
    if (c.tempo) { sum += cfg_.w_tempo * *c.tempo; weights += cfg_.w_tempo; }
    if (c.motion_smoothness) { sum += cfg_.w_smoothness * *c.motion_smoothness; weights += cfg_.w_smoothness; }
    if (c.rep_consistency) { sum += cfg_.w_consistency * *c.rep_consistency; weights += cfg_.w_consistency; }
    if (c.strain) { sum += cfg_.w_strain * (100.0 * out.strain_modifier); weights += cfg_.w_strain; }
    out.trainer = weights > 0.0 ? sum / weights : 0.0;
    out.estimated = true;
  }

  if (c.strain_estimated) out.estimated = true;
  out.user = std::min(out.trainer, 100.0);
  return out;
}

IntensityScore IntensityScorer::apply_feedback(const IntensityScore& pre, const IntensityComponents& c,
                                               Feedback fb) const {
  IntensityScore out = pre;
  switch (fb) {
    case Feedback::Challenge:
      out.trainer = 100.0;
      break;
    case Feedback::EasyKiller:
      out.trainer = pre.trainer * cfg_.easy_killer_factor;
      break;
    default:
      out = score(c, fb);
      break;
  }
  out.user = std::min(out.trainer, 100.0);
  return out;
}

PendingSet::PendingSet(SetRecord draft, const IntensityComponents& components,
                       const IntensityScorer& scorer, int64_t opened_ms, int64_t window_ms)
  : record_(std::move(draft)),
    components_(components),
    scorer_(&scorer),
    pre_feedback_(scorer.score(components, Feedback::None)),
    deadline_ms_(opened_ms + window_ms) {
  record_.tempo_score = components_.tempo;
  record_.motion_smoothness = components_.motion_smoothness;
  record_.rep_consistency = components_.rep_consistency;
  record_.strain_modifier = pre_feedback_.strain_modifier;
  record_.intensity = pre_feedback_;
  record_.locked = false;
}

void PendingSet::apply_feedback(Feedback fb, int64_t t_ms) {
  if (record_.locked) {
    throw SetLockedError("set " + std::to_string(record_.set_index) + " of " +
                         record_.exercise_id + " is locked");
  }
  record_.feedback = fb;
  record_.intensity = scorer_->apply_feedback(pre_feedback_, components_, fb);
  lock(t_ms);
}

bool PendingSet::expire(int64_t now_ms) {
  if (record_.locked || now_ms < deadline_ms_) return false;
  close(now_ms);
  return true;
}

void PendingSet::close(int64_t t_ms) {
  if (record_.locked) return;
  // unanswered: neutral feedback, score stays at its pre-feedback value
  record_.feedback = Feedback::None;
  record_.intensity = pre_feedback_;
  lock(t_ms);
}

void PendingSet::lock(int64_t t_ms) {
  record_.locked = true;
  record_.locked_ms = t_ms;
}
