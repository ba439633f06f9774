// Repository: CutLog
// Component: Frame Offset Compensator Contract Tests
// Copyright (c) 2026 CutLog

#include <gtest/gtest.h>

#include "cutlog/correlator/FrameOffsetCompensator.h"
#include "cutlog/timecode/Timecode.hpp"

namespace cutlog::correlator::testing {
namespace {

using timecode::FPS_2997;
using timecode::FPS_25;
using timecode::Timecode;

Timecode Df(const char* text) { return *Timecode::Parse(text, FPS_2997, true); }

TEST(FrameOffsetCompensatorContract, PositiveOffsetAddsFrames) {
  const auto result = FrameOffsetCompensator::Create(3, FPS_2997, true);
  ASSERT_TRUE(result.ok);
  EXPECT_EQ(result.compensator->Compensate(Df("00:00:59;28")).ToString(), "00:01:00;03");
}

TEST(FrameOffsetCompensatorContract, NegativeOffsetCrossesDropFrameMinute) {
  const auto result = FrameOffsetCompensator::Create(-5, FPS_2997, true);
  ASSERT_TRUE(result.ok);
  EXPECT_EQ(result.compensator->Compensate(Df("00:10:00;02")).ToString(), "00:09:59;27");
}

TEST(FrameOffsetCompensatorContract, ZeroOffsetIsIdentity) {
  const auto result = FrameOffsetCompensator::Create(0, FPS_2997, true);
  ASSERT_TRUE(result.ok);
  const Timecode tc = Df("10:20:30;15");
  EXPECT_EQ(result.compensator->Compensate(tc), tc);
}

TEST(FrameOffsetCompensatorContract, InverseRestoresOriginal) {
  const auto result = FrameOffsetCompensator::Create(-7, FPS_2997, true);
  ASSERT_TRUE(result.ok);
  const FrameOffsetCompensator comp = *result.compensator;
  const Timecode tc = Df("00:00:00;03");
  EXPECT_EQ(comp.Inverse().Compensate(comp.Compensate(tc)), tc);
  EXPECT_EQ(comp.Inverse().offset_frames(), 7);
}

TEST(FrameOffsetCompensatorContract, OffsetOfAFullDayIsInvalid) {
  const int64_t per_day = Timecode::FramesPerDay(FPS_25, false);
  EXPECT_TRUE(FrameOffsetCompensator::Create(per_day - 1, FPS_25, false).ok);
  const auto too_far = FrameOffsetCompensator::Create(per_day, FPS_25, false);
  EXPECT_FALSE(too_far.ok);
  EXPECT_EQ(too_far.error, CompensatorError::kInvalidOffset);
  EXPECT_FALSE(too_far.compensator.has_value());
  EXPECT_FALSE(FrameOffsetCompensator::Create(-per_day, FPS_25, false).ok);
}

TEST(FrameOffsetCompensatorContract, UnsupportedFormatIsInvalid) {
  const auto result = FrameOffsetCompensator::Create(1, FPS_25, true);
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, CompensatorError::kInvalidOffset);
}

}  // namespace
}  // namespace cutlog::correlator::testing
