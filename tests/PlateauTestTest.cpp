#include "PlateauTest.hpp"

#include <gtest/gtest.h>

TEST(PlateauGuardrails, EpleyEstimate) {
  EXPECT_NEAR(estimate_one_rm(100.0, 10), 133.333, 1e-3);
  EXPECT_DOUBLE_EQ(estimate_one_rm(0.0, 10), 0.0);
  EXPECT_DOUBLE_EQ(estimate_one_rm(50.0, 0), 0.0);
}

TEST(PlateauGuardrails, PrescriptionStaysInsideBands) {
  PlateauConfig cfg;
  TrainingParameters current;
  current.sets = 5;
  current.reps = 12;

  PlateauGuardrails g = make_plateau_guardrails(cfg, current, 100.0);
  EXPECT_DOUBLE_EQ(g.weight_kg, 40.0);
  EXPECT_EQ(g.reps, 6);
  EXPECT_EQ(g.sets, 4);
  EXPECT_GE(g.tut_s, 30.0);
  EXPECT_LE(g.tut_s, 60.0);
  EXPECT_NEAR(g.eccentric_s / g.tempo_s, 0.70, 1e-12);
  EXPECT_NEAR(g.eccentric_s + g.concentric_s, g.tempo_s, 1e-12);
  EXPECT_TRUE(guardrail_violations(cfg, g).empty());

  TrainingParameters p = plateau_parameters(g);
  EXPECT_EQ(p.reps, 6);
  EXPECT_DOUBLE_EQ(p.volume_kg, 40.0);
}

TEST(PlateauGuardrails, ViolationsAreReported) {
  PlateauConfig cfg;
  PlateauGuardrails g = make_plateau_guardrails(cfg, TrainingParameters{}, 100.0);

  PlateauGuardrails heavy = g;
  heavy.weight_kg = 60.0;
  EXPECT_EQ(guardrail_violations(cfg, heavy).size(), 1u);

  PlateauGuardrails long_set = g;
  long_set.tut_s = 75.0;
  EXPECT_FALSE(guardrail_violations(cfg, long_set).empty());

  PlateauGuardrails no_rm = g;
  no_rm.one_rm_kg = 0.0;
  EXPECT_FALSE(guardrail_violations(cfg, no_rm).empty());
}

TEST(PlateauCues, DownUpPerRepThenHold) {
  PlateauGuardrails g = make_plateau_guardrails(PlateauConfig{}, TrainingParameters{}, 100.0);
  std::vector<HapticCue> cues = plateau_cue_schedule(g, 2);

  ASSERT_EQ(cues.size(), static_cast<size_t>(2 * g.reps + 1));
  for (int r = 0; r < g.reps; ++r) {
    const HapticCue& down = cues[2 * r];
    const HapticCue& up = cues[2 * r + 1];
    EXPECT_EQ(down.kind, CueKind::Down);
    EXPECT_EQ(down.pulses, 1);
    EXPECT_EQ(up.kind, CueKind::Up);
    EXPECT_EQ(up.pulses, 2);
    EXPECT_NEAR(up.offset_s - down.offset_s, g.eccentric_s, 1e-9);
    EXPECT_EQ(down.set_index, 2);
  }
  EXPECT_EQ(cues.back().kind, CueKind::Hold);
  EXPECT_EQ(cues.back().pulses, 3);
  EXPECT_NEAR(cues.back().offset_s, g.tut_s, 1e-9);
  EXPECT_STREQ(to_string(CueKind::Up), "up");
}
