// Repository: CutLog
// Component: Timecode Tracker Contract Tests
// Purpose: Extrapolation, frozen transport, staleness and discontinuity handling.
// Copyright (c) 2026 CutLog

#include <gtest/gtest.h>

#include <mutex>
#include <string>
#include <vector>

#include "cutlog/timing/TimecodeTracker.h"
#include "cutlog/util/Logger.hpp"

namespace cutlog::timing::testing {
namespace {

using devices::TransportState;
using timecode::FPS_25;
using timecode::FPS_2997;
using timecode::Timecode;

constexpr int64_t kMs = 1'000;

Timecode Tc25(const char* text) { return *Timecode::Parse(text, FPS_25, false); }

class TimecodeTrackerContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    util::Logger::SetWarnSink([this](const std::string& line) {
      std::lock_guard<std::mutex> lock(warn_mutex_);
      warnings_.push_back(line);
    });
  }

  void TearDown() override { util::Logger::SetWarnSink(nullptr); }

  static TrackerConfig Config25() {
    TrackerConfig cfg;
    cfg.rate = FPS_25;
    cfg.drop_frame = false;
    cfg.staleness_threshold_ms = 2'000;
    return cfg;
  }

  size_t WarningsContaining(const std::string& needle) {
    std::lock_guard<std::mutex> lock(warn_mutex_);
    size_t n = 0;
    for (const auto& w : warnings_) {
      if (w.find(needle) != std::string::npos) ++n;
    }
    return n;
  }

  std::mutex warn_mutex_;
  std::vector<std::string> warnings_;
};

TEST_F(TimecodeTrackerContractTest, NoReadingsMeansNoReference) {
  TimecodeTracker tracker(Config25());
  const auto r = tracker.EstimateAt(0);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, TimecodeEstimateError::kNoReferenceAvailable);
  EXPECT_FALSE(r.timecode.has_value());
}

TEST_F(TimecodeTrackerContractTest, NonPlayingReadingsAloneAreNoReference) {
  TimecodeTracker tracker(Config25());
  ASSERT_TRUE(tracker.RecordTick(Tc25("01:00:00:00"), TransportState::kStopped, 0));
  const auto r = tracker.EstimateAt(100 * kMs);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, TimecodeEstimateError::kNoReferenceAvailable);
}

TEST_F(TimecodeTrackerContractTest, ExtrapolatesFromPlayingReading) {
  TimecodeTracker tracker(Config25());
  ASSERT_TRUE(tracker.RecordTick(Tc25("01:00:00:00"), TransportState::kPlaying, 1'000 * kMs));

  const auto exact = tracker.EstimateAt(1'000 * kMs);
  ASSERT_TRUE(exact.ok);
  EXPECT_EQ(exact.timecode->ToString(), "01:00:00:00");
  EXPECT_EQ(exact.confidence, EstimateConfidence::kLocked);

  const auto later = tracker.EstimateAt(1'400 * kMs);
  ASSERT_TRUE(later.ok);
  EXPECT_EQ(later.timecode->ToString(), "01:00:00:10");

  // 39ms is less than one 40ms frame.
  const auto partial = tracker.EstimateAt(1'039 * kMs);
  ASSERT_TRUE(partial.ok);
  EXPECT_EQ(partial.timecode->ToString(), "01:00:00:00");
}

TEST_F(TimecodeTrackerContractTest, DropFrameExtrapolationCountsRealFrames) {
  TrackerConfig cfg;
  TimecodeTracker tracker(cfg);
  const Timecode start = *Timecode::Parse("00:00:59;00", FPS_2997, true);
  ASSERT_TRUE(tracker.RecordTick(start, TransportState::kPlaying, 0));
  // 1.001s at 29.97 is exactly 30 frames, across the minute label skip.
  const auto r = tracker.EstimateAt(1'001 * kMs);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.timecode->ToString(), "00:01:00;02");
}

TEST_F(TimecodeTrackerContractTest, UsesReadingInEffectAtPastInstant) {
  TimecodeTracker tracker(Config25());
  ASSERT_TRUE(tracker.RecordTick(Tc25("01:00:00:00"), TransportState::kPlaying, 0));
  ASSERT_TRUE(tracker.RecordTick(Tc25("01:00:01:00"), TransportState::kPlaying, 1'000 * kMs));
  ASSERT_TRUE(tracker.RecordTick(Tc25("01:00:02:00"), TransportState::kPlaying, 2'000 * kMs));

  const auto r = tracker.EstimateAt(500 * kMs);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.timecode->ToString(), "01:00:00:12");
}

TEST_F(TimecodeTrackerContractTest, PausedTransportServesFrozenValue) {
  TimecodeTracker tracker(Config25());
  ASSERT_TRUE(tracker.RecordTick(Tc25("01:00:00:00"), TransportState::kPlaying, 0));
  ASSERT_TRUE(tracker.RecordTick(Tc25("01:00:00:12"), TransportState::kPaused, 500 * kMs));

  const auto r = tracker.EstimateAt(900 * kMs);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.timecode->ToString(), "01:00:00:12");
  EXPECT_EQ(r.confidence, EstimateConfidence::kDegraded);

  // Before the pause the playing reading still extrapolates.
  const auto before = tracker.EstimateAt(400 * kMs);
  ASSERT_TRUE(before.ok);
  EXPECT_EQ(before.timecode->ToString(), "01:00:00:10");
  EXPECT_EQ(before.confidence, EstimateConfidence::kLocked);
}

TEST_F(TimecodeTrackerContractTest, StaleReferenceBeyondThreshold) {
  TimecodeTracker tracker(Config25());
  ASSERT_TRUE(tracker.RecordTick(Tc25("01:00:00:00"), TransportState::kPlaying, 0));

  EXPECT_TRUE(tracker.EstimateAt(2'000 * kMs).ok);

  const auto r = tracker.EstimateAt(2'000 * kMs + 1);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, TimecodeEstimateError::kStaleReference);
}

TEST_F(TimecodeTrackerContractTest, InstantBeforeFirstReadingBackFills) {
  TimecodeTracker tracker(Config25());
  ASSERT_TRUE(tracker.RecordTick(Tc25("01:00:00:00"), TransportState::kPlaying, 1'000 * kMs));

  const auto r = tracker.EstimateAt(600 * kMs);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.timecode->ToString(), "00:59:59:15");

  const auto too_early = tracker.EstimateAt(-1'001 * kMs);
  EXPECT_FALSE(too_early.ok);
  EXPECT_EQ(too_early.error, TimecodeEstimateError::kStaleReference);
}

TEST_F(TimecodeTrackerContractTest, BackwardMoveIsDiscontinuityAndNewReference) {
  TimecodeTracker tracker(Config25());
  ASSERT_TRUE(tracker.RecordTick(Tc25("01:00:10:00"), TransportState::kPlaying, 0));
  ASSERT_TRUE(tracker.RecordTick(Tc25("01:00:00:00"), TransportState::kPlaying, 100 * kMs));

  EXPECT_EQ(tracker.GetSnapshot().discontinuities, 1u);
  EXPECT_EQ(WarningsContaining("DISCONTINUITY"), 1u);

  const auto r = tracker.EstimateAt(140 * kMs);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.timecode->ToString(), "01:00:00:01");
}

TEST_F(TimecodeTrackerContractTest, MidnightWrapIsNotADiscontinuity) {
  TimecodeTracker tracker(Config25());
  ASSERT_TRUE(tracker.RecordTick(Tc25("23:59:59:24"), TransportState::kPlaying, 0));
  ASSERT_TRUE(tracker.RecordTick(Tc25("00:00:00:00"), TransportState::kPlaying, 40 * kMs));
  EXPECT_EQ(tracker.GetSnapshot().discontinuities, 0u);
  EXPECT_EQ(WarningsContaining("DISCONTINUITY"), 0u);
}

TEST_F(TimecodeTrackerContractTest, RejectsReadingAtWrongRate) {
  TimecodeTracker tracker(Config25());
  const Timecode df = *Timecode::Parse("01:00:00;00", FPS_2997, true);
  EXPECT_FALSE(tracker.RecordTick(df, TransportState::kPlaying, 0));

  const auto snap = tracker.GetSnapshot();
  EXPECT_EQ(snap.ticks_rejected, 1u);
  EXPECT_EQ(snap.ticks_recorded, 0u);
  EXPECT_FALSE(snap.has_playing_reference);
  EXPECT_EQ(WarningsContaining("Rejected tick"), 1u);
}

TEST_F(TimecodeTrackerContractTest, EvictedPlayingReadingStillAnswersOldInstants) {
  TrackerConfig cfg = Config25();
  cfg.history_depth = 2;
  TimecodeTracker tracker(cfg);
  ASSERT_TRUE(tracker.RecordTick(Tc25("01:00:00:00"), TransportState::kPlaying, 0));
  ASSERT_TRUE(tracker.RecordTick(Tc25("01:00:01:00"), TransportState::kPlaying, 1'000 * kMs));
  ASSERT_TRUE(tracker.RecordTick(Tc25("01:00:01:01"), TransportState::kPlaying, 1'040 * kMs));

  const auto r = tracker.EstimateAt(500 * kMs);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.timecode->ToString(), "01:00:00:12");
}

TEST_F(TimecodeTrackerContractTest, SnapshotReflectsLatestReading) {
  TimecodeTracker tracker(Config25());
  ASSERT_TRUE(tracker.RecordTick(Tc25("01:00:00:00"), TransportState::kPlaying, 0));
  ASSERT_TRUE(tracker.RecordTick(Tc25("01:00:00:05"), TransportState::kShuttling, 200 * kMs));

  const auto snap = tracker.GetSnapshot();
  ASSERT_TRUE(snap.last_timecode.has_value());
  EXPECT_EQ(snap.last_timecode->ToString(), "01:00:00:05");
  EXPECT_EQ(snap.last_state, TransportState::kShuttling);
  EXPECT_EQ(snap.last_observed_us, 200 * kMs);
  EXPECT_TRUE(snap.has_playing_reference);
  EXPECT_EQ(snap.ticks_recorded, 2u);
}

}  // namespace
}  // namespace cutlog::timing::testing
