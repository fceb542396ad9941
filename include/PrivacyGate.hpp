#pragma once
#include "CalibrationState.hpp"
#include "IntensityScorer.hpp"
#include "SignalNormalizer.hpp"
#include "StrainEstimator.hpp"

#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

enum class StackKind { Supplement, Medication };

struct StackEntry {
  StackKind kind = StackKind::Supplement;
  std::string name;
  std::string dose;
  bool is_public = false;
  bool is_prescription = false;
  int64_t created_ms = 0;
};

// The only way derived data leaves the device. Every export path goes
// through one of these overloads; the raw-signal overloads exist only to
// fail. Holds no state, so concurrent finalize calls never interact.
class PrivacyGate {
public:
  // never leaves: throws PolicyViolation
  nlohmann::json export_payload(const SensorSample& s) const;
  nlohmann::json export_payload(const StrainReading& r) const;

  // raw numeric, never hashed
  nlohmann::json export_payload(const IntensityScore& score) const;
  // locked records only (throws std::invalid_argument for a draft)
  nlohmann::json export_payload(const SetRecord& record) const;
  nlohmann::json export_history(const std::vector<SetRecord>& records) const;
  nlohmann::json export_payload(const CalibrationState& state) const;

  // Public non-prescription supplements leave as a hash of their public
  // portion; everything else is redacted (none).
  boost::optional<nlohmann::json> export_payload(const StackEntry& entry) const;

  static std::string sha1_hex(const std::string& text);
};

// On-device supplement/medication store. Entries older than 52 weeks are
// wiped unless the athlete opted out.
class SupplementVault {
public:
  static constexpr int64_t kRetentionMs = 52LL * 7 * 24 * 60 * 60 * 1000;

  void add(const StackEntry& e);
  size_t size() const;
  std::vector<StackEntry> entries() const;

  void set_auto_wipe(bool enabled);
  bool auto_wipe() const;

  // number of entries removed
  size_t purge_expired(int64_t now_ms);

  // hashes of everything the gate lets out
  nlohmann::json sync_payload(const PrivacyGate& gate) const;

private:
  mutable std::mutex mu_;
  std::vector<StackEntry> entries_;
  bool auto_wipe_ = true;
};
