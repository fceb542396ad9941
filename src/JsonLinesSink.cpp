#include "JsonLinesSink.hpp"

using json = nlohmann::json;

void JsonLinesSink::emit(const json& j) {
  out_ << j.dump() << std::endl;
}

void JsonLinesSink::on_set_begun(const std::string& exercise, int set_index, int64_t t_ms) {
  emit({{"event", "set_begun"}, {"exercise", exercise}, {"set", set_index}, {"t_ms", t_ms}});
}

void JsonLinesSink::on_set_ended(const std::string& exercise, int set_index, int64_t t_ms) {
  emit({{"event", "set_ended"}, {"exercise", exercise}, {"set", set_index}, {"t_ms", t_ms}});
}

void JsonLinesSink::on_live_intensity(const IntensityScore& score, int reps, int64_t t_ms) {
  if (live_count_++ % live_every_ != 0) return;
  emit({{"event", "live"},
        {"t_ms", t_ms},
        {"reps", reps},
        {"user_pct", score.user_percent()},
        {"estimated", score.estimated}});
}

void JsonLinesSink::on_set_locked(const SetRecord& record) {
  emit({{"event", "set_locked"}, {"record", gate_.export_payload(record)}});
}

void JsonLinesSink::on_rest_update(const RestUpdate& update, const RestPeriod& period) {
  if (!update.extended && !update.life_pause_started) return;
  emit({{"event", "rest"},
        {"state", to_string(update.state)},
        {"remaining_s", update.remaining_s},
        {"target_s", period.target_s},
        {"extended", update.extended},
        {"life_pause", update.life_pause_started}});
}

void JsonLinesSink::on_rest_complete(const RestPeriod& period) {
  emit({{"event", "rest_complete"},
        {"planned_s", period.planned_s},
        {"target_s", period.target_s},
        {"actual_s", period.actual_s},
        {"auto_extended", period.auto_extended},
        {"suppressed_life_pause", period.suppressed_life_pause},
        {"genuine_recovery_s", period.genuine_recovery_s}});
}

void JsonLinesSink::on_forgotten_set_prompt(const ForgottenSetEvent& event) {
  emit({{"event", "forgotten_set_prompt"}, {"t_ms", event.trigger_ms}});
}

void JsonLinesSink::on_forgotten_set_resolved(const ForgottenSetEvent& event) {
  emit({{"event", "forgotten_set_resolved"},
        {"response", event.response ? to_string(*event.response) : "none"},
        {"boundary_ms", event.boundary_ms}});
}

void JsonLinesSink::on_haptic_cue(const HapticCue& cue) {
  emit({{"event", "cue"},
        {"kind", to_string(cue.kind)},
        {"pulses", cue.pulses},
        {"offset_s", cue.offset_s},
        {"rep", cue.rep_index}});
}

void JsonLinesSink::on_safety_stop(const std::string& exercise, const std::string& reason) {
  emit({{"event", "safety_stop"}, {"exercise", exercise}, {"reason", reason}});
}

void JsonLinesSink::on_status(bool estimated, bool degraded, bool stale) {
  emit({{"event", "status"}, {"estimated", estimated}, {"degraded", degraded}, {"stale", stale}});
}
