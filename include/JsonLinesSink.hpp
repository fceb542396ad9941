#pragma once
#include "CoachingEvents.hpp"
#include "PrivacyGate.hpp"

#include <ostream>

// Writes every published event as one JSON object per line, the format
// the Node bridge reads. Set records go through the privacy gate.
class JsonLinesSink : public ICoachingSink {
public:
  explicit JsonLinesSink(std::ostream& out) : out_(out) {}

  void on_set_begun(const std::string& exercise, int set_index, int64_t t_ms) override;
  void on_set_ended(const std::string& exercise, int set_index, int64_t t_ms) override;
  void on_live_intensity(const IntensityScore& score, int reps, int64_t t_ms) override;
  void on_set_locked(const SetRecord& record) override;
  void on_rest_update(const RestUpdate& update, const RestPeriod& period) override;
  void on_rest_complete(const RestPeriod& period) override;
  void on_forgotten_set_prompt(const ForgottenSetEvent& event) override;
  void on_forgotten_set_resolved(const ForgottenSetEvent& event) override;
  void on_haptic_cue(const HapticCue& cue) override;
  void on_safety_stop(const std::string& exercise, const std::string& reason) override;
  void on_status(bool estimated, bool degraded, bool stale) override;

  // live intensity every n-th tick only (1 = every tick)
  void set_live_every(int n) { live_every_ = n > 0 ? n : 1; }

private:
  void emit(const nlohmann::json& j);

  std::ostream& out_;
  PrivacyGate gate_;
  int live_every_ = 1;
  long live_count_ = 0;
};
