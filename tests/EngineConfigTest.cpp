#include "EngineConfig.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

using nlohmann::json;

TEST(EngineConfig, DefaultsAreTheShippedValues) {
  EngineConfig c = engine_config_from_json(json::object());
  EXPECT_DOUBLE_EQ(c.intensity.w_tempo, 0.30);
  EXPECT_DOUBLE_EQ(c.intensity.w_strain, 0.10);
  EXPECT_DOUBLE_EQ(c.intensity.feedback_neutral, 75.0);
  EXPECT_DOUBLE_EQ(c.intensity.easy_killer_factor, 0.875);
  EXPECT_EQ(c.rest.min_s, 30);
  EXPECT_EQ(c.rest.max_s, 90);
  EXPECT_EQ(c.forgotten_set.distraction_bonus_s, 15);
  EXPECT_EQ(c.forgotten_set.prompt_timeout_ms, 10000);
  EXPECT_DOUBLE_EQ(c.calibration.target_intensity, 98.0);
  EXPECT_EQ(c.calibration.max_calibration_sets, 8);
}

TEST(EngineConfig, PartialOverride) {
  json j = {
    {"strain", {{"resting_hr_bpm", 58.0}}},
    {"rest", {{"max_s", 80}}},
  };
  EngineConfig c = engine_config_from_json(j);
  EXPECT_DOUBLE_EQ(c.strain.resting_hr_bpm, 58.0);
  EXPECT_DOUBLE_EQ(c.strain.baseline_spo2_pct, 98.0);
  EXPECT_EQ(c.rest.max_s, 80);
  EXPECT_EQ(c.rest.min_s, 30);
}

TEST(EngineConfig, RejectsBrokenInvariants) {
  EXPECT_THROW(engine_config_from_json(json{{"rest", {{"min_s", 95}}}}), std::runtime_error);
  EXPECT_THROW(engine_config_from_json(json{{"intensity", {{"easy_killer_factor", 0.5}}}}),
               std::runtime_error);
  EXPECT_THROW(engine_config_from_json(json{{"intensity", {{"easy_killer_factor", 0.84}}}}),
               std::runtime_error);
  EXPECT_THROW(engine_config_from_json(json{{"intensity", {{"easy_killer_factor", 0.91}}}}),
               std::runtime_error);
  EXPECT_NO_THROW(engine_config_from_json(json{{"intensity", {{"easy_killer_factor", 0.85}}}}));
  EXPECT_NO_THROW(engine_config_from_json(json{{"intensity", {{"easy_killer_factor", 0.90}}}}));
  EXPECT_THROW(engine_config_from_json(json{{"tempo", 3}}), std::runtime_error);
  EXPECT_THROW(engine_config_from_json(json::array()), std::runtime_error);
}

TEST(EngineConfig, LoadsFromFile) {
  std::string path = ::testing::TempDir() + "engine_config_test.json";
  {
    std::ofstream f(path);
    f << R"({"calibration": {"cycle_weeks": 6}})";
  }
  EngineConfig c = load_engine_config(path);
  EXPECT_EQ(c.calibration.cycle_weeks, 6);
  std::remove(path.c_str());

  EXPECT_THROW(load_engine_config(path), std::runtime_error);
}
