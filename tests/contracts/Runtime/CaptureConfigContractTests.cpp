// Repository: CutLog
// Component: Capture Configuration Contract Tests
// Copyright (c) 2026 CutLog

#include <gtest/gtest.h>

#include "cutlog/runtime/CaptureConfig.h"

namespace cutlog::runtime::testing {
namespace {

TEST(CaptureConfigContract, DefaultsAreValid) {
  const CaptureConfig config;
  const auto v = config.Validate();
  EXPECT_TRUE(v.valid);
  EXPECT_TRUE(v.errors.empty());
  EXPECT_EQ(config.frame_rate, timecode::FPS_2997);
  EXPECT_TRUE(config.drop_frame);
  EXPECT_EQ(config.staleness_threshold_ms, 2'000);
}

TEST(CaptureConfigContract, DropFrameAtNonNtscRateIsInvalid) {
  CaptureConfig config;
  config.frame_rate = timecode::FPS_25;
  config.drop_frame = true;
  EXPECT_FALSE(config.Validate().valid);
}

TEST(CaptureConfigContract, EveryProblemIsReported) {
  CaptureConfig config;
  config.staleness_threshold_ms = 0;
  config.channel_capacity = 0;
  config.reorder_window_ms = -1;
  config.tick_history_depth = 0;
  const auto v = config.Validate();
  EXPECT_FALSE(v.valid);
  EXPECT_EQ(v.errors.size(), 4u);
}

TEST(CaptureConfigContract, OffsetBeyondOneDayIsInvalid) {
  CaptureConfig config;
  config.frame_offset = -2'589'408;
  const auto v = config.Validate();
  ASSERT_FALSE(v.valid);
  EXPECT_NE(v.errors[0].find("INVALID_OFFSET"), std::string::npos);
}

TEST(CaptureConfigContract, ParseFrameRate) {
  EXPECT_EQ(ParseFrameRate("29.97"), timecode::FPS_2997);
  EXPECT_EQ(ParseFrameRate("23.976"), timecode::FPS_23976);
  EXPECT_EQ(ParseFrameRate("25"), timecode::FPS_25);
  EXPECT_EQ(ParseFrameRate("30000/1001"), timecode::FPS_2997);
  EXPECT_EQ(ParseFrameRate("60/2"), timecode::FPS_30);
  EXPECT_FALSE(ParseFrameRate("fast").has_value());
  EXPECT_FALSE(ParseFrameRate("30/0").has_value());
  EXPECT_FALSE(ParseFrameRate("").has_value());
}

TEST(CaptureConfigContract, DerivedConfigsCarrySettings) {
  CaptureConfig config;
  config.frame_rate = timecode::FPS_25;
  config.drop_frame = false;
  config.staleness_threshold_ms = 750;
  config.edl_title = "Late Show";
  config.reject_empty_export = true;

  const auto tracker = config.ToTrackerConfig();
  EXPECT_EQ(tracker.rate, timecode::FPS_25);
  EXPECT_FALSE(tracker.drop_frame);
  EXPECT_EQ(tracker.staleness_threshold_ms, 750);

  const auto edl = config.ToExportConfig();
  EXPECT_EQ(edl.title, "Late Show");
  EXPECT_TRUE(edl.reject_empty_export);
  EXPECT_EQ(FrameRateToString(timecode::FPS_2997), "29.97");
  EXPECT_EQ(FrameRateToString(timecode::FPS_25), "25");
}

}  // namespace
}  // namespace cutlog::runtime::testing
