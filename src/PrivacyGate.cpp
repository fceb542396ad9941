#include "PrivacyGate.hpp"
#include "Errors.hpp"

#include <boost/uuid/detail/sha1.hpp>
#include <boost/version.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace {
  json optional_number(const boost::optional<double>& v) {
    return v ? json(*v) : json(nullptr);
  }

  std::string normalized(const std::string& s) {
    std::string out;
    for (char c : s) {
      if (!std::isspace(static_cast<unsigned char>(c))) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
      }
    }
    return out;
  }
}

json PrivacyGate::export_payload(const SensorSample& s) const {
  throw PolicyViolation("sensor_sample", "raw sample at t=" + std::to_string(s.t_ms) +
                                         "ms may not leave the device");
}

json PrivacyGate::export_payload(const StrainReading& r) const {
  throw PolicyViolation("strain_reading", "strain reading at t=" + std::to_string(r.t_ms) +
                                          "ms may not leave the device");
}

json PrivacyGate::export_payload(const IntensityScore& score) const {
  return json{
    {"trainer", score.trainer},
    {"user", score.user},
    {"estimated", score.estimated},
    {"feedback_term", score.feedback_term},
    {"strain_modifier", score.strain_modifier}
  };
}

json PrivacyGate::export_payload(const SetRecord& r) const {
  if (!r.locked) {
    throw std::invalid_argument("set " + std::to_string(r.set_index) + " of " + r.exercise_id +
                                " is still open for feedback");
  }
  return json{
    {"exercise", r.exercise_id},
    {"set_index", r.set_index},
    {"reps", r.reps},
    {"weight_kg", r.weight_kg},
    {"tempo_score", optional_number(r.tempo_score)},
    {"motion_smoothness", optional_number(r.motion_smoothness)},
    {"rep_consistency", optional_number(r.rep_consistency)},
    {"feedback", to_string(r.feedback)},
    {"strain_modifier", r.strain_modifier},
    {"intensity", export_payload(r.intensity)},
    {"started_ms", r.started_ms},
    {"ended_ms", r.ended_ms},
    {"locked_ms", r.locked_ms},
    {"distraction_flagged", r.distraction_flagged}
  };
}

json PrivacyGate::export_history(const std::vector<SetRecord>& records) const {
  json out = json::array();
  for (const auto& r : records) out.push_back(export_payload(r));
  return out;
}

json PrivacyGate::export_payload(const CalibrationState& state) const {
  return json(state);
}

boost::optional<json> PrivacyGate::export_payload(const StackEntry& e) const {
  if (e.kind == StackKind::Medication) return boost::none;
  if (!e.is_public || e.is_prescription) return boost::none;

  return json{
    {"kind", "supplement"},
    {"hash", sha1_hex(normalized(e.name) + "|" + normalized(e.dose))},
    {"created_ms", e.created_ms}
  };
}

std::string PrivacyGate::sha1_hex(const std::string& text) {
  boost::uuids::detail::sha1 h;
  h.process_bytes(text.data(), text.size());
  boost::uuids::detail::sha1::digest_type digest;
  h.get_digest(digest);

  char buf[41];
#if BOOST_VERSION >= 108600
  // 20 bytes since Boost 1.86
  for (int i = 0; i < 20; ++i) {
    std::snprintf(buf + i * 2, 3, "%02x", static_cast<unsigned>(digest[i]));
  }
#else
  // five big-endian 32-bit words before that
  for (int i = 0; i < 5; ++i) {
    std::snprintf(buf + i * 8, 9, "%08x", static_cast<unsigned>(digest[i]));
  }
#endif
  return std::string(buf, 40);
}

constexpr int64_t SupplementVault::kRetentionMs;

void SupplementVault::add(const StackEntry& e) {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.push_back(e);
}

size_t SupplementVault::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

std::vector<StackEntry> SupplementVault::entries() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_;
}

void SupplementVault::set_auto_wipe(bool enabled) {
  std::lock_guard<std::mutex> lock(mu_);
  auto_wipe_ = enabled;
}

bool SupplementVault::auto_wipe() const {
  std::lock_guard<std::mutex> lock(mu_);
  return auto_wipe_;
}

size_t SupplementVault::purge_expired(int64_t now_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!auto_wipe_) return 0;

  size_t before = entries_.size();
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [now_ms](const StackEntry& e) {
                                  return now_ms - e.created_ms >= kRetentionMs;
                                }),
                 entries_.end());
  size_t removed = before - entries_.size();
  if (removed > 0) std::cerr << "[privacy] wiped " << removed << " stack entries\n";
  return removed;
}

json SupplementVault::sync_payload(const PrivacyGate& gate) const {
  json out = json::array();
  for (const auto& e : entries()) {
    auto p = gate.export_payload(e);
    if (p) out.push_back(*p);
  }
  return out;
}
