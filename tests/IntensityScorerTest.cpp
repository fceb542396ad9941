#include "Errors.hpp"
#include "IntensityScorer.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace {

IntensityComponents components(double tempo, double smooth, double consistency, double strain) {
  IntensityComponents c;
  c.tempo = tempo;
  c.motion_smoothness = smooth;
  c.rep_consistency = consistency;
  c.strain = strain;
  return c;
}

}  // namespace

TEST(IntensityScorer, DocumentedWeightedSum) {
  IntensityScorer scorer(IntensityConfig{});
  IntensityScore s = scorer.score(components(80, 90, 70, 60), Feedback::Neutral);

  // 0.30*80 + 0.25*90 + 0.20*70 + 0.15*75 + 0.10*100
  EXPECT_NEAR(s.trainer, 81.75, 1e-9);
  EXPECT_DOUBLE_EQ(s.feedback_term, 75.0);
  EXPECT_DOUBLE_EQ(s.strain_modifier, 1.0);
  EXPECT_FALSE(s.estimated);
}

TEST(IntensityScorer, EndToEndExample) {
  IntensityScorer scorer(IntensityConfig{});
  IntensityScore s = scorer.score(components(85, 92, 88, 78), Feedback::Neutral);

  EXPECT_NEAR(s.trainer, 87.35, 1e-9);
  EXPECT_NEAR(s.user, 87.35, 1e-9);
  EXPECT_EQ(s.user_percent(), 87);

  // no rating at all counts as neutral
  EXPECT_NEAR(scorer.score(components(85, 92, 88, 78)).trainer, 87.35, 1e-9);
}

TEST(IntensityScorer, StrainModifierEntersAsTerm) {
  IntensityScorer scorer(IntensityConfig{});
  IntensityScore green = scorer.score(components(80, 80, 80, 85.0));
  IntensityScore yellow = scorer.score(components(80, 80, 80, 90.0));
  IntensityScore red = scorer.score(components(80, 80, 80, 99.0));

  EXPECT_NEAR(green.trainer - yellow.trainer, 0.10 * 5.0, 1e-9);
  EXPECT_NEAR(green.trainer - red.trainer, 0.10 * 15.0, 1e-9);
}

TEST(IntensityScorer, UserIsTrainerCappedAtHundred) {
  IntensityScorer scorer(IntensityConfig{});
  for (double v = 0.0; v <= 160.0; v += 10.0) {
    for (Feedback fb : {Feedback::None, Feedback::KeepGoing, Feedback::Flag}) {
      IntensityScore s = scorer.score(components(v, v, v, 50.0), fb);
      EXPECT_DOUBLE_EQ(s.user, std::min(s.trainer, 100.0));
    }
  }

  IntensityScore over = scorer.score(components(150, 150, 150, 50.0), Feedback::KeepGoing);
  EXPECT_GT(over.trainer, 100.0);
  EXPECT_DOUBLE_EQ(over.user, 100.0);
}

TEST(IntensityScorer, MissingTermsRenormalizeAndFlagEstimated) {
  IntensityScorer scorer(IntensityConfig{});
  IntensityComponents c;
  c.tempo = 80.0;
  c.motion_smoothness = 80.0;
  c.rep_consistency = 80.0;

  IntensityScore s = scorer.score(c);
  EXPECT_TRUE(s.estimated);
  EXPECT_NEAR(s.trainer, (0.30 * 80 + 0.25 * 80 + 0.20 * 80 + 0.15 * 75) / 0.90, 1e-9);

  IntensityComponents partial_strain = components(80, 80, 80, 40.0);
  partial_strain.strain_estimated = true;
  EXPECT_TRUE(scorer.score(partial_strain).estimated);
}

TEST(IntensityScorer, FeedbackTerms) {
  IntensityScorer scorer(IntensityConfig{});
  EXPECT_DOUBLE_EQ(scorer.feedback_term(Feedback::None), 75.0);
  EXPECT_DOUBLE_EQ(scorer.feedback_term(Feedback::Neutral), 75.0);
  EXPECT_DOUBLE_EQ(scorer.feedback_term(Feedback::KeepGoing), 90.0);
  EXPECT_DOUBLE_EQ(scorer.feedback_term(Feedback::Flag), 40.0);

  EXPECT_EQ(*feedback_from_string("easy killer"), Feedback::EasyKiller);
  EXPECT_EQ(*feedback_from_string("keep going"), Feedback::KeepGoing);
  EXPECT_FALSE(feedback_from_string("meh"));
}

TEST(IntensityScorer, ChallengeLocksAtExactlyHundred) {
  IntensityScorer scorer(IntensityConfig{});
  for (double v : {20.0, 87.35, 140.0}) {
    IntensityComponents c = components(v, v, v, 50.0);
    IntensityScore locked = scorer.apply_feedback(scorer.score(c), c, Feedback::Challenge);
    EXPECT_DOUBLE_EQ(locked.trainer, 100.0);
    EXPECT_DOUBLE_EQ(locked.user, 100.0);
  }
}

TEST(IntensityScorer, EasyKillerReducesByTenToFifteenPercent) {
  IntensityScorer scorer(IntensityConfig{});
  for (double v = 10.0; v <= 150.0; v += 7.0) {
    IntensityComponents c = components(v, v, v, 50.0);
    IntensityScore pre = scorer.score(c);
    IntensityScore locked = scorer.apply_feedback(pre, c, Feedback::EasyKiller);
    double reduction = (pre.trainer - locked.trainer) / pre.trainer;
    EXPECT_GE(reduction, 0.10);
    EXPECT_LE(reduction, 0.15);
  }
}

TEST(PendingSet, EasyKillerLocksInRangeAndIsImmutable) {
  IntensityScorer scorer(IntensityConfig{});
  SetRecord draft;
  draft.exercise_id = "curl";
  draft.set_index = 1;

  PendingSet pending(draft, components(85, 92, 88, 78), scorer, 10000, 5000);
  EXPECT_FALSE(pending.locked());
  EXPECT_NEAR(pending.pre_feedback().trainer, 87.35, 1e-9);
  EXPECT_EQ(pending.deadline_ms(), 15000);

  pending.apply_feedback(Feedback::EasyKiller, 12000);
  EXPECT_TRUE(pending.locked());
  EXPECT_GE(pending.record().intensity.trainer, 74.0);
  EXPECT_LE(pending.record().intensity.trainer, 79.0);
  EXPECT_EQ(pending.record().feedback, Feedback::EasyKiller);
  EXPECT_EQ(pending.record().locked_ms, 12000);

  double locked_value = pending.record().intensity.trainer;
  EXPECT_THROW(pending.apply_feedback(Feedback::Challenge, 12500), SetLockedError);
  EXPECT_FALSE(pending.expire(20000));
  EXPECT_DOUBLE_EQ(pending.record().intensity.trainer, locked_value);
}

TEST(PendingSet, UnansweredWindowFinalizesNeutral) {
  IntensityScorer scorer(IntensityConfig{});
  PendingSet pending(SetRecord{}, components(85, 92, 88, 78), scorer, 0, 5000);

  EXPECT_FALSE(pending.expire(4999));
  EXPECT_FALSE(pending.locked());
  EXPECT_TRUE(pending.expire(5000));
  EXPECT_TRUE(pending.locked());
  EXPECT_EQ(pending.record().feedback, Feedback::None);
  EXPECT_NEAR(pending.record().intensity.trainer, 87.35, 1e-9);
  EXPECT_THROW(pending.apply_feedback(Feedback::Flag, 6000), SetLockedError);
}
