#include "MotionQualityScorer.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <cmath>

namespace {

double smoothness_for_wobble(float amplitude_g) {
  MotionQualityScorer q(QualityConfig{});
  for (int i = 0; i < 100; ++i) {
    float wobble = (i % 2 == 0) ? amplitude_g : -amplitude_g;
    q.update(make_sample(i * 40, 0.0f, 1.0f + wobble));
  }
  return *q.motion_smoothness();
}

RepPhase phase(PhaseKind kind, int64_t start_ms, int64_t duration_ms, double rom) {
  RepPhase p;
  p.kind = kind;
  p.start_ms = start_ms;
  p.end_ms = start_ms + duration_ms;
  p.rom_deg = rom;
  return p;
}

}  // namespace

TEST(CoefficientOfVariation, Basics) {
  EXPECT_DOUBLE_EQ(coefficient_of_variation({}), 0.0);
  EXPECT_DOUBLE_EQ(coefficient_of_variation({4.0}), 0.0);
  EXPECT_DOUBLE_EQ(coefficient_of_variation({2.0, 2.0, 2.0}), 0.0);
  EXPECT_DOUBLE_EQ(coefficient_of_variation({1.0, 3.0}), 0.5);
}

TEST(MotionSmoothness, PerfectlySteadyIsHundred) {
  MotionQualityScorer q(QualityConfig{});
  EXPECT_FALSE(q.motion_smoothness());
  for (int i = 0; i < 50; ++i) q.update(make_sample(i * 40));
  ASSERT_TRUE(q.motion_smoothness());
  EXPECT_DOUBLE_EQ(*q.motion_smoothness(), 100.0);
}

TEST(MotionSmoothness, MoreJerkNeverScoresHigher) {
  double prev = 100.0;
  for (float a : {0.0f, 0.005f, 0.01f, 0.02f, 0.05f, 0.1f, 0.3f}) {
    double s = smoothness_for_wobble(a);
    EXPECT_LE(s, prev) << a;
    EXPECT_GE(s, 0.0);
    prev = s;
  }
  EXPECT_LT(smoothness_for_wobble(0.5f), 1.0);
}

TEST(MotionSmoothness, StaleSampleRestartsDifferencing) {
  MotionQualityScorer q(QualityConfig{});
  q.update(make_sample(0, 0.0f, 1.0f));
  SensorSample jump = make_sample(2000, 0.0f, 3.0f);
  jump.stale = true;
  q.update(jump);
  q.update(make_sample(2040, 0.0f, 3.0f));

  // the 2 g step across the gap must not count as jerk
  EXPECT_DOUBLE_EQ(*q.motion_smoothness(), 100.0);
}

TEST(RepConsistency, EvenPhasesScoreHundred) {
  MotionQualityScorer q(QualityConfig{});
  std::vector<RepPhase> phases;
  for (int r = 0; r < 4; ++r) {
    phases.push_back(phase(PhaseKind::Concentric, r * 4000, 1500, 90.0));
    phases.push_back(phase(PhaseKind::Eccentric, r * 4000 + 1500, 2000, 90.0));
  }
  EXPECT_DOUBLE_EQ(*q.rep_consistency(phases), 100.0);
}

TEST(RepConsistency, DegradesWithSpreadAndFloorsAtZero) {
  MotionQualityScorer q(QualityConfig{});
  EXPECT_FALSE(q.rep_consistency({}));
  EXPECT_DOUBLE_EQ(*q.rep_consistency({phase(PhaseKind::Concentric, 0, 1500, 90.0)}), 100.0);

  std::vector<RepPhase> mild = {
    phase(PhaseKind::Concentric, 0, 1400, 88.0),
    phase(PhaseKind::Concentric, 4000, 1600, 92.0),
  };
  std::vector<RepPhase> wild = {
    phase(PhaseKind::Concentric, 0, 500, 30.0),
    phase(PhaseKind::Concentric, 4000, 3000, 150.0),
  };
  double m = *q.rep_consistency(mild);
  double w = *q.rep_consistency(wild);
  EXPECT_LT(m, 100.0);
  EXPECT_LT(w, m);
  EXPECT_DOUBLE_EQ(w, 0.0);
}

TEST(MotionSmoothness, TruncateDropsJerkAfterBoundary) {
  MotionQualityScorer q(QualityConfig{});
  for (int i = 0; i < 25; ++i) q.update(make_sample(i * 40));
  for (int i = 25; i < 50; ++i) q.update(make_sample(i * 40, 0.0f, (i % 2) ? 2.0f : 0.2f));
  EXPECT_LT(*q.motion_smoothness(), 100.0);

  q.truncate_after(24 * 40);
  EXPECT_DOUBLE_EQ(*q.motion_smoothness(), 100.0);
}
