#include "AnomalyDetector.hpp"

void DebouncedAnomalyDetector::arm() {
  state_ = AnomalyState::Watching;
  resolution_ = AnomalyResolution::None;
  condition_since_ = -1;
  pending_since_ = -1;
}

void DebouncedAnomalyDetector::disarm() {
  state_ = AnomalyState::Idle;
  condition_since_ = -1;
  pending_since_ = -1;
}

bool DebouncedAnomalyDetector::update(int64_t t_ms, bool condition) {
  switch (state_) {
    case AnomalyState::Idle:
    case AnomalyState::Resolved:
      return false;

    case AnomalyState::Watching:
      if (!condition) {
        condition_since_ = -1;
        return false;
      }
      if (condition_since_ < 0) condition_since_ = t_ms;
      if (t_ms - condition_since_ < cfg_.debounce_ms) return false;
      state_ = AnomalyState::Pending;
      pending_since_ = t_ms;
      return true;

    case AnomalyState::Pending:
      if (cfg_.pending_timeout_ms >= 0 && t_ms - pending_since_ >= cfg_.pending_timeout_ms) {
        resolve(AnomalyResolution::TimedOut, t_ms);
      } else if (cfg_.release_on_clear && !condition) {
        resolve(AnomalyResolution::Cleared, t_ms);
      }
      return false;
  }
  return false;
}

bool DebouncedAnomalyDetector::resolve(AnomalyResolution r, int64_t t_ms) {
  if (state_ != AnomalyState::Pending) return false;
  state_ = AnomalyState::Resolved;
  resolution_ = r;
  resolved_at_ = t_ms;
  return true;
}

const char* to_string(AnomalyState s) {
  switch (s) {
    case AnomalyState::Idle: return "idle";
    case AnomalyState::Watching: return "watching";
    case AnomalyState::Pending: return "pending";
    case AnomalyState::Resolved: return "resolved";
  }
  return "idle";
}
