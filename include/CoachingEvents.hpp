#pragma once
#include "ForgottenSetDetector.hpp"
#include "IntensityScorer.hpp"
#include "PlateauTest.hpp"
#include "RestController.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Everything the core publishes, one callback per signal type. The UI,
// voice/haptic service and sync layer implement the parts they care
// about; the defaults do nothing.
class ICoachingSink {
public:
  virtual ~ICoachingSink() = default;

  virtual void on_set_begun(const std::string& /*exercise*/, int /*set_index*/, int64_t /*t_ms*/) {}
  virtual void on_set_ended(const std::string& /*exercise*/, int /*set_index*/, int64_t /*t_ms*/) {}

  // live estimate, recomputed every tick during a set
  virtual void on_live_intensity(const IntensityScore& /*score*/, int /*reps*/, int64_t /*t_ms*/) {}
  virtual void on_set_locked(const SetRecord& /*record*/) {}

  virtual void on_rest_update(const RestUpdate& /*update*/, const RestPeriod& /*period*/) {}
  virtual void on_rest_complete(const RestPeriod& /*period*/) {}

  virtual void on_forgotten_set_prompt(const ForgottenSetEvent& /*event*/) {}
  virtual void on_forgotten_set_resolved(const ForgottenSetEvent& /*event*/) {}

  virtual void on_haptic_cue(const HapticCue& /*cue*/) {}
  virtual void on_safety_stop(const std::string& /*exercise*/, const std::string& /*reason*/) {}

  // "Estimated" badge / degraded (no motion) banner
  virtual void on_status(bool /*estimated*/, bool /*degraded*/, bool /*stale*/) {}
};

// Keeps everything it receives; used by tests and the replay runner.
class RecordingSink : public ICoachingSink {
public:
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

  std::vector<int> sets_begun;
  std::vector<int> sets_ended;
  std::vector<IntensityScore> live;
  std::vector<SetRecord> locked;
  std::vector<RestUpdate> rest_updates;
  std::vector<RestPeriod> rests;
  std::vector<ForgottenSetEvent> prompts;
  std::vector<ForgottenSetEvent> resolutions;
  std::vector<HapticCue> cues;
  std::vector<std::string> safety_stops;

  bool last_estimated = false;
  bool last_degraded = false;
  int status_changes = 0;
};
