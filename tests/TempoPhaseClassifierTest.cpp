#include "TempoPhaseClassifier.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

namespace {

RepPhase phase(PhaseKind kind, double seconds) {
  RepPhase p;
  p.kind = kind;
  p.start_ms = 0;
  p.end_ms = static_cast<int64_t>(seconds * 1000.0);
  return p;
}

// pause, concentric (+gyro), eccentric (-gyro), pause; 20 ms ticks
int64_t feed_rep(TempoPhaseClassifier& c, int64_t t, int64_t up_ms, int64_t down_ms) {
  for (int64_t end = t + 400; t < end; t += 20) c.update(make_sample(t, 0.0f));
  for (int64_t end = t + up_ms; t < end; t += 20) c.update(make_sample(t, 60.0f));
  for (int64_t end = t + down_ms; t < end; t += 20) c.update(make_sample(t, -50.0f));
  c.update(make_sample(t, 0.0f));
  return t + 20;
}

}  // namespace

TEST(TempoPhaseScore, FullMarksInsideTolerance) {
  TempoConfig cfg;
  EXPECT_DOUBLE_EQ(tempo_phase_score(phase(PhaseKind::Concentric, 1.5), cfg), 100.0);
  EXPECT_DOUBLE_EQ(tempo_phase_score(phase(PhaseKind::Concentric, 1.7), cfg), 100.0);
  EXPECT_DOUBLE_EQ(tempo_phase_score(phase(PhaseKind::Eccentric, 1.7), cfg), 100.0);
}

TEST(TempoPhaseScore, LinearPenaltyBeyondTolerance) {
  TempoConfig cfg;
  // 25 % slow: 10 points of excess at 2 per point
  EXPECT_NEAR(tempo_phase_score(phase(PhaseKind::Concentric, 1.875), cfg), 80.0, 1e-9);
  EXPECT_NEAR(tempo_phase_score(phase(PhaseKind::Eccentric, 1.5), cfg), 80.0, 1e-9);
  EXPECT_DOUBLE_EQ(tempo_phase_score(phase(PhaseKind::Concentric, 3.0), cfg), 0.0);
}

TEST(TempoPhaseScore, MonotonicInDeviation) {
  TempoConfig cfg;
  double prev = 101.0;
  for (int ms = 1500; ms <= 4000; ms += 20) {
    double s = tempo_phase_score(phase(PhaseKind::Concentric, ms / 1000.0), cfg);
    EXPECT_LE(s, prev);
    prev = s;
  }
}

TEST(TempoPhaseClassifier, SegmentsOneRepIntoTwoPhases) {
  TempoPhaseClassifier c(TempoConfig{});
  feed_rep(c, 0, 1500, 2000);

  ASSERT_EQ(c.phases().size(), 2u);
  EXPECT_EQ(c.total_reps(), 1);

  const RepPhase& up = c.phases()[0];
  EXPECT_EQ(up.kind, PhaseKind::Concentric);
  EXPECT_TRUE(up.pause_detected);
  EXPECT_NEAR(up.duration_s(), 1.5, 1e-9);
  EXPECT_GT(up.rom_deg, 0.0);

  const RepPhase& down = c.phases()[1];
  EXPECT_EQ(down.kind, PhaseKind::Eccentric);
  EXPECT_FALSE(down.pause_detected);
  EXPECT_NEAR(down.duration_s(), 2.0, 1e-9);

  ASSERT_TRUE(c.tempo_score());
  EXPECT_DOUBLE_EQ(*c.tempo_score(), 100.0);
}

TEST(TempoPhaseClassifier, CountsRepsAndSplits) {
  TempoPhaseClassifier c(TempoConfig{});
  int64_t t = 0;
  for (int i = 0; i < 3; ++i) t = feed_rep(c, t, 1500, 2000);
  t = feed_rep(c, t, 3000, 2000);

  EXPECT_EQ(c.total_reps(), 4);
  auto splits = c.splits();
  ASSERT_EQ(splits.size(), 8u);
  EXPECT_DOUBLE_EQ(splits[6].target_s, 1.5);
  EXPECT_DOUBLE_EQ(splits[6].score, 0.0);
  EXPECT_LT(*c.tempo_score(), 100.0);
}

TEST(TempoPhaseClassifier, IgnoresShortNoise) {
  TempoPhaseClassifier c(TempoConfig{});
  int64_t t = 0;
  for (; t < 400; t += 20) c.update(make_sample(t, 0.0f));
  for (int64_t end = t + 100; t < end; t += 20) c.update(make_sample(t, 40.0f));
  c.update(make_sample(t, 0.0f));

  EXPECT_TRUE(c.phases().empty());
  EXPECT_FALSE(c.tempo_score());
}

TEST(TempoPhaseClassifier, EccentricFirstToggle) {
  TempoConfig cfg;
  cfg.concentric_first = false;
  TempoPhaseClassifier c(cfg);
  feed_rep(c, 0, 1500, 2000);

  ASSERT_EQ(c.phases().size(), 2u);
  EXPECT_EQ(c.phases()[0].kind, PhaseKind::Eccentric);
  EXPECT_EQ(c.phases()[1].kind, PhaseKind::Concentric);
}

TEST(TempoPhaseClassifier, FinishClosesOpenPhase) {
  TempoPhaseClassifier c(TempoConfig{});
  int64_t t = 0;
  for (; t < 400; t += 20) c.update(make_sample(t, 0.0f));
  for (int64_t end = t + 1000; t < end; t += 20) c.update(make_sample(t, 60.0f));

  PhaseEvent ev = c.finish(t);
  EXPECT_TRUE(ev.phase_completed);
  EXPECT_EQ(c.phases().size(), 1u);
  EXPECT_EQ(c.total_reps(), 0);
}

TEST(TempoPhaseClassifier, TruncateDropsLaterPhases) {
  TempoPhaseClassifier c(TempoConfig{});
  int64_t t = feed_rep(c, 0, 1500, 2000);
  feed_rep(c, t, 1500, 2000);
  ASSERT_EQ(c.total_reps(), 2);

  c.truncate_after(t);
  EXPECT_EQ(c.total_reps(), 1);
  EXPECT_EQ(c.phases().size(), 2u);
}

TEST(TempoPhaseClassifier, MissingMotionIsIgnored) {
  TempoPhaseClassifier c(TempoConfig{});
  SensorSample s = make_sample(0, 90.0f);
  s.motion_avail = false;
  PhaseEvent ev = c.update(s);
  EXPECT_FALSE(ev.phase_completed);
  EXPECT_TRUE(c.phases().empty());
}
