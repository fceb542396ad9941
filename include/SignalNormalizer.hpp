#pragma once
#include "EngineConfig.hpp"
#include "SensorFrame.hpp"

#include <boost/optional.hpp>

#include <cstdint>
#include <deque>
#include <mutex>

struct Vec3 {
  float x = 0, y = 0, z = 0;
  float norm() const;
};

// One tick after normalization. Ephemeral: lives in the rolling window only
// and is never handed to storage or the network (PrivacyGate rejects it).
struct SensorSample {
  int64_t t_ms = 0;
  boost::optional<float> hr_bpm;
  boost::optional<float> spo2_pct;
  Vec3 accel;   // g
  Vec3 gyro;    // deg/s

  bool hr_avail = false;
  bool spo2_avail = false;
  bool motion_avail = false;

  bool frozen = false;  // low battery: values are the last good sample
  bool stale = false;   // gap, reordering or dropped ticks before this one
};

// Bounded rolling window, oldest first.
class SampleWindow {
public:
  explicit SampleWindow(size_t capacity) : capacity_(capacity) {}

  void push(const SensorSample& s);
  void clear() { samples_.clear(); }

  size_t size() const { return samples_.size(); }
  bool empty() const { return samples_.empty(); }
  const SensorSample& operator[](size_t i) const { return samples_[i]; }
  const SensorSample& back() const { return samples_.back(); }

  // index of the first sample with t_ms >= t (size() if none)
  size_t first_at_or_after(int64_t t) const;

private:
  size_t capacity_;
  std::deque<SensorSample> samples_;
};

class SignalNormalizer {
public:
  explicit SignalNormalizer(const NormalizerConfig& cfg);

  // `dropped_before` is set when the producer overwrote unconsumed frames
  // (see SampleMailbox); the resulting sample is marked stale.
  SensorSample normalize(const SensorFrame& f, bool dropped_before = false);

  // No motion seen on any frame this session: tempo and live intensity
  // are disabled rather than defaulted.
  bool degraded() const { return frames_seen_ > 0 && !motion_seen_; }
  bool frozen() const { return frozen_; }

  const SampleWindow& window() const { return window_; }
  void reset();

private:
  NormalizerConfig cfg_;
  SampleWindow window_;

  boost::optional<SensorSample> last_good_;
  int64_t last_t_ = -1;
  long frames_seen_ = 0;
  bool motion_seen_ = false;
  bool frozen_ = false;
};

// Single-slot hand-off between the sensor callback thread and the tick
// loop. A post() over an unconsumed frame replaces it, so the consumer
// always works on the latest data and never queues.
class SampleMailbox {
public:
  void post(const SensorFrame& f);

  // false if nothing new; `dropped` reports whether frames were overwritten
  bool take(SensorFrame& out, bool& dropped);

  long total_dropped() const;

private:
  mutable std::mutex mu_;
  SensorFrame slot_{};
  bool full_ = false;
  bool overwritten_ = false;
  long total_dropped_ = 0;
};
