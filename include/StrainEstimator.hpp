#pragma once
#include "EngineConfig.hpp"
#include "SignalNormalizer.hpp"

#include <boost/optional.hpp>

#include <cstdint>

enum class StrainZone { Green, Yellow, Red };  // <=85, (85,95], >95

// Ephemeral 0-100 physiological load. Lives for one tick; PrivacyGate
// refuses to serialize it.
struct StrainReading {
  int64_t t_ms = 0;
  double value = 0.0;

  // normalized 0-100 terms, before weighting
  double hr_rise = 0.0;
  double spo2_drop = 0.0;
  double recovery_delay = 0.0;

  bool estimated = false;  // HR and/or SpO2 missing, neutral term substituted
  bool stale = false;
  bool held = false;       // frozen device: repeated from the previous tick
};

// Step function applied to intensity: 1.0 / 0.95 / 0.85.
double strain_modifier(double strain);
StrainZone strain_zone(double strain);

// strain = 0.4*HRrise + 0.3*SpO2drop + 0.3*recoveryDelay over a rolling
// window, each term normalized against the personal baseline.
class StrainEstimator {
public:
  explicit StrainEstimator(const StrainConfig& cfg);

  StrainReading update(const SensorSample& s, const SampleWindow& window);

  const boost::optional<StrainReading>& last() const { return last_; }
  void reset();

private:
  double normalize(double amount, double full_scale) const;

  StrainConfig cfg_;
  boost::optional<StrainReading> last_;
  int64_t elevated_since_ = -1;  // first tick HR stayed above baseline + margin
};
