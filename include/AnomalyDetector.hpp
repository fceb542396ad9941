#pragma once
#include <cstdint>

enum class AnomalyState { Idle, Watching, Pending, Resolved };

enum class AnomalyResolution {
  None,
  Confirmed,   // the athlete (or caller) accepted the anomaly
  Dismissed,   // explicitly rejected
  TimedOut,    // nobody answered within pending_timeout_ms
  Cleared      // the condition went away by itself (release_on_clear)
};

struct AnomalyConfig {
  int64_t debounce_ms = 0;          // condition must hold this long to go Pending
  int64_t pending_timeout_ms = -1;  // < 0: Pending never times out
  bool release_on_clear = false;
};

// Idle -> Watching -> Pending -> Resolved, shared by forgotten-set
// detection and life-pause suppression. Callers feed it a boolean
// condition per tick; the detector owns the debounce, the one-shot
// entry into Pending and the timeout.
class DebouncedAnomalyDetector {
public:
  explicit DebouncedAnomalyDetector(const AnomalyConfig& cfg) : cfg_(cfg) {}

  void arm();
  void disarm();

  // true exactly on the tick the detector enters Pending
  bool update(int64_t t_ms, bool condition);

  // Pending -> Resolved; false (and no change) in any other state
  bool resolve(AnomalyResolution r, int64_t t_ms);

  AnomalyState state() const { return state_; }
  AnomalyResolution resolution() const { return resolution_; }

  // start of the condition streak that led to Pending (-1 if none)
  int64_t condition_since() const { return condition_since_; }
  int64_t pending_since() const { return pending_since_; }
  int64_t resolved_at() const { return resolved_at_; }

private:
  AnomalyConfig cfg_;
  AnomalyState state_ = AnomalyState::Idle;
  AnomalyResolution resolution_ = AnomalyResolution::None;
  int64_t condition_since_ = -1;
  int64_t pending_since_ = -1;
  int64_t resolved_at_ = -1;
};

const char* to_string(AnomalyState s);
