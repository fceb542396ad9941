#include "Errors.hpp"
#include "PrivacyGate.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

SetRecord locked_record(int index, double trainer) {
  SetRecord r;
  r.exercise_id = "curl";
  r.set_index = index;
  r.reps = 10;
  r.weight_kg = 12.5;
  r.tempo_score = 85.0;
  r.intensity.trainer = trainer;
  r.intensity.user = std::min(trainer, 100.0);
  r.locked = true;
  r.locked_ms = 1000;
  return r;
}

StackEntry supplement(const std::string& name, bool is_public, bool rx) {
  StackEntry e;
  e.kind = StackKind::Supplement;
  e.name = name;
  e.dose = "5 g";
  e.is_public = is_public;
  e.is_prescription = rx;
  return e;
}

}  // namespace

TEST(PrivacyGate, RawSamplesNeverLeave) {
  PrivacyGate gate;
  SensorSample s;
  s.hr_bpm = 140.0f;
  EXPECT_THROW(gate.export_payload(s), PolicyViolation);

  try {
    gate.export_payload(s);
  } catch (const PolicyViolation& e) {
    EXPECT_EQ(e.category(), "sensor_sample");
  }
}

TEST(PrivacyGate, StrainReadingsNeverLeave) {
  PrivacyGate gate;
  StrainReading r;
  r.value = 72.0;
  EXPECT_THROW(gate.export_payload(r), PolicyViolation);
}

TEST(PrivacyGate, IntensityExportsRawNumbers) {
  PrivacyGate gate;
  IntensityScore score;
  score.trainer = 87.35;
  score.user = 87.35;

  nlohmann::json j = gate.export_payload(score);
  ASSERT_TRUE(j["trainer"].is_number());
  EXPECT_DOUBLE_EQ(j["trainer"].get<double>(), 87.35);
  EXPECT_DOUBLE_EQ(j["user"].get<double>(), 87.35);
  EXPECT_EQ(j.find("hash"), j.end());
}

TEST(PrivacyGate, SetRecordCarriesNoRawStrain) {
  PrivacyGate gate;
  nlohmann::json j = gate.export_payload(locked_record(1, 120.0));

  EXPECT_DOUBLE_EQ(j["intensity"]["trainer"].get<double>(), 120.0);
  EXPECT_DOUBLE_EQ(j["intensity"]["user"].get<double>(), 100.0);
  EXPECT_TRUE(j["motion_smoothness"].is_null());
  EXPECT_EQ(j.find("strain"), j.end());
  EXPECT_EQ(j.find("hr_bpm"), j.end());
}

TEST(PrivacyGate, OpenDraftsAreNotExported) {
  PrivacyGate gate;
  SetRecord draft = locked_record(1, 80.0);
  draft.locked = false;
  EXPECT_THROW(gate.export_payload(draft), std::invalid_argument);
}

TEST(PrivacyGate, SupplementsLeaveOnlyHashed) {
  PrivacyGate gate;

  auto pub = gate.export_payload(supplement("Creatine", true, false));
  ASSERT_TRUE(pub);
  std::string hash = (*pub)["hash"].get<std::string>();
  EXPECT_EQ(hash.size(), 40u);
  EXPECT_EQ(pub->dump().find("Creatine"), std::string::npos);
  EXPECT_EQ(hash, PrivacyGate::sha1_hex("creatine|5g"));

  EXPECT_FALSE(gate.export_payload(supplement("Creatine", false, false)));
  EXPECT_FALSE(gate.export_payload(supplement("Prednisone", true, true)));

  StackEntry med = supplement("Metformin", true, false);
  med.kind = StackKind::Medication;
  EXPECT_FALSE(gate.export_payload(med));
}

TEST(PrivacyGate, Sha1KnownVector) {
  EXPECT_EQ(PrivacyGate::sha1_hex("abc"), "a9993e364706816aba3e25717850c26c9cd0d89d");
  EXPECT_EQ(PrivacyGate::sha1_hex(""), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

TEST(PrivacyGate, ConcurrentExportsDoNotInterfere) {
  PrivacyGate gate;
  std::vector<std::thread> workers;
  std::vector<double> seen(4, 0.0);
  for (int w = 0; w < 4; ++w) {
    workers.emplace_back([&gate, &seen, w]() {
      for (int i = 0; i < 200; ++i) {
        nlohmann::json j = gate.export_payload(locked_record(w, 50.0 + w));
        seen[w] = j["intensity"]["trainer"].get<double>();
      }
    });
  }
  for (auto& t : workers) t.join();
  for (int w = 0; w < 4; ++w) EXPECT_DOUBLE_EQ(seen[w], 50.0 + w);
}

TEST(SupplementVault, WipesAfterFiftyTwoWeeksUnlessOptedOut) {
  const int64_t retention = SupplementVault::kRetentionMs;
  SupplementVault vault;
  vault.add(supplement("Creatine", true, false));
  StackEntry newer = supplement("Magnesium", true, false);
  newer.created_ms = 1000;
  vault.add(newer);

  EXPECT_EQ(vault.purge_expired(retention - 1), 0u);
  EXPECT_EQ(vault.purge_expired(retention), 1u);
  EXPECT_EQ(vault.size(), 1u);

  vault.set_auto_wipe(false);
  EXPECT_EQ(vault.purge_expired(retention * 3), 0u);
  EXPECT_EQ(vault.size(), 1u);
}

TEST(SupplementVault, SyncPayloadHoldsOnlyPublicHashes) {
  PrivacyGate gate;
  SupplementVault vault;
  vault.add(supplement("Creatine", true, false));
  vault.add(supplement("Ashwagandha", false, false));
  StackEntry med = supplement("Sertraline", false, true);
  med.kind = StackKind::Medication;
  vault.add(med);

  nlohmann::json payload = vault.sync_payload(gate);
  ASSERT_EQ(payload.size(), 1u);
  EXPECT_EQ(payload[0]["kind"].get<std::string>(), "supplement");
  EXPECT_EQ(payload.dump().find("Sertraline"), std::string::npos);
}
