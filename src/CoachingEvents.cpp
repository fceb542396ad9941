#include "CoachingEvents.hpp"

void RecordingSink::on_set_begun(const std::string&, int set_index, int64_t) {
  sets_begun.push_back(set_index);
}

void RecordingSink::on_set_ended(const std::string&, int set_index, int64_t) {
  sets_ended.push_back(set_index);
}

void RecordingSink::on_live_intensity(const IntensityScore& score, int, int64_t) {
  live.push_back(score);
}

void RecordingSink::on_set_locked(const SetRecord& record) {
  locked.push_back(record);
}

void RecordingSink::on_rest_update(const RestUpdate& update, const RestPeriod&) {
  rest_updates.push_back(update);
}

void RecordingSink::on_rest_complete(const RestPeriod& period) {
  rests.push_back(period);
}

void RecordingSink::on_forgotten_set_prompt(const ForgottenSetEvent& event) {
  prompts.push_back(event);
}

void RecordingSink::on_forgotten_set_resolved(const ForgottenSetEvent& event) {
  resolutions.push_back(event);
}

void RecordingSink::on_haptic_cue(const HapticCue& cue) {
  cues.push_back(cue);
}

void RecordingSink::on_safety_stop(const std::string&, const std::string& reason) {
  safety_stops.push_back(reason);
}

void RecordingSink::on_status(bool estimated, bool degraded, bool) {
  last_estimated = estimated;
  last_degraded = degraded;
  ++status_changes;
}
