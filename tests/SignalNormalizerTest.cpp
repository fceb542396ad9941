#include "SignalNormalizer.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

TEST(SignalNormalizer, MissingWearableMarksChannelsUnavailable) {
  SignalNormalizer n(NormalizerConfig{});
  SensorSample s = n.normalize(make_frame(0, 5.0f));

  EXPECT_FALSE(s.hr_avail);
  EXPECT_FALSE(s.spo2_avail);
  EXPECT_FALSE(s.hr_bpm);
  EXPECT_TRUE(s.motion_avail);
  EXPECT_FLOAT_EQ(s.gyro.y, 5.0f);
  EXPECT_FALSE(n.degraded());
}

TEST(SignalNormalizer, NoMotionAnywhereIsDegraded) {
  SignalNormalizer n(NormalizerConfig{});
  SensorFrame f = make_frame(0, 0.0f, 120.0f, 97.0f);
  f.has_motion = false;

  SensorSample s = n.normalize(f);
  EXPECT_FALSE(s.motion_avail);
  EXPECT_TRUE(s.hr_avail);
  EXPECT_TRUE(n.degraded());
}

TEST(SignalNormalizer, LowBatteryFreezesOnLastGoodSample) {
  SignalNormalizer n(NormalizerConfig{});
  n.normalize(make_frame(0, 30.0f, 110.0f, 97.0f));

  SensorFrame low = make_frame(40, -80.0f, 150.0f, 90.0f);
  low.battery_pct = 9.0f;
  SensorSample s = n.normalize(low);

  EXPECT_TRUE(s.frozen);
  EXPECT_TRUE(n.frozen());
  EXPECT_EQ(s.t_ms, 40);
  EXPECT_FLOAT_EQ(s.gyro.y, 30.0f);
  ASSERT_TRUE(s.hr_bpm);
  EXPECT_FLOAT_EQ(*s.hr_bpm, 110.0f);
  EXPECT_EQ(n.window().size(), 1u);

  SensorSample resumed = n.normalize(make_frame(80, 10.0f));
  EXPECT_FALSE(resumed.frozen);
  EXPECT_FALSE(n.frozen());
}

TEST(SignalNormalizer, GapsAndReorderingAreStale) {
  NormalizerConfig cfg;
  cfg.max_gap_ms = 500;
  SignalNormalizer n(cfg);

  EXPECT_FALSE(n.normalize(make_frame(0)).stale);
  EXPECT_FALSE(n.normalize(make_frame(40)).stale);
  EXPECT_TRUE(n.normalize(make_frame(1000)).stale);

  size_t before = n.window().size();
  SensorSample late = n.normalize(make_frame(900));
  EXPECT_TRUE(late.stale);
  EXPECT_EQ(n.window().size(), before);

  EXPECT_TRUE(n.normalize(make_frame(1040), true).stale);
}

TEST(SampleWindow, BoundedAndSearchable) {
  SampleWindow w(3);
  for (int64_t t = 0; t < 5; ++t) w.push(make_sample(t * 100));

  EXPECT_EQ(w.size(), 3u);
  EXPECT_EQ(w[0].t_ms, 200);
  EXPECT_EQ(w.first_at_or_after(250), 1u);
  EXPECT_EQ(w.first_at_or_after(0), 0u);
  EXPECT_EQ(w.first_at_or_after(1000), 3u);
}

TEST(SampleMailbox, KeepsOnlyTheLatestFrame) {
  SampleMailbox box;
  SensorFrame out;
  bool dropped = false;

  EXPECT_FALSE(box.take(out, dropped));

  box.post(make_frame(0));
  box.post(make_frame(40));
  ASSERT_TRUE(box.take(out, dropped));
  EXPECT_EQ(out.t_ms, 40);
  EXPECT_TRUE(dropped);
  EXPECT_EQ(box.total_dropped(), 1);

  box.post(make_frame(80));
  ASSERT_TRUE(box.take(out, dropped));
  EXPECT_FALSE(dropped);
  EXPECT_FALSE(box.take(out, dropped));
}
