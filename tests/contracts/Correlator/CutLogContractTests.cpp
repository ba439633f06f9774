// Repository: CutLog
// Component: Cut Log Contract Tests
// Purpose: Every mutation that would break ordering or continuity is refused.
// Copyright (c) 2026 CutLog

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cutlog/correlator/CutLog.h"
#include "cutlog/util/Logger.hpp"

namespace cutlog::correlator::testing {
namespace {

using timecode::FPS_2997;
using timecode::Timecode;

Timecode Df(const char* text) { return *Timecode::Parse(text, FPS_2997, true); }

CutBoundary At(int64_t observed_us, const char* tc) {
  CutBoundary b;
  b.observed_us = observed_us;
  b.timecode = Df(tc);
  return b;
}

CutRecord Open(uint64_t index, const char* source_id, const CutBoundary& in) {
  CutRecord r;
  r.sequence_index = index;
  r.source = devices::SourceId{source_id, source_id};
  r.record_in = in;
  return r;
}

class CutLogContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    util::Logger::SetErrorSink([this](const std::string& line) { errors_.push_back(line); });
  }
  void TearDown() override { util::Logger::SetErrorSink(nullptr); }

  CutLog log_{FPS_2997, true};
  std::vector<std::string> errors_;
};

TEST_F(CutLogContractTest, AppendCloseAppendKeepsContinuity) {
  const CutBoundary b0 = At(0, "01:00:00;00");
  const CutBoundary b1 = At(10'000'000, "01:00:10;00");
  log_.Append(Open(0, "cam1", b0));
  EXPECT_TRUE(log_.HasOpenRecord());
  log_.CloseOpen(b1);
  log_.Append(Open(1, "cam2", b1));

  const auto records = log_.Records();
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(*records[0].record_out, records[1].record_in);
  EXPECT_EQ(records[0].DurationFrames(), 300);
  EXPECT_TRUE(records[1].IsOpen());
  EXPECT_EQ(log_.BoundaryCount(), 2u);
}

TEST_F(CutLogContractTest, SequenceGapThrows) {
  log_.Append(Open(0, "cam1", At(0, "01:00:00;00")));
  log_.CloseOpen(At(1'000'000, "01:00:01;00"));
  EXPECT_THROW(log_.Append(Open(2, "cam2", At(1'000'000, "01:00:01;00"))), InvariantViolation);
  EXPECT_EQ(log_.Size(), 1u);
  ASSERT_FALSE(errors_.empty());
  EXPECT_NE(errors_.back().find("INVARIANT VIOLATION"), std::string::npos);
}

TEST_F(CutLogContractTest, FirstRecordMustBeIndexZero) {
  EXPECT_THROW(log_.Append(Open(1, "cam1", At(0, "01:00:00;00"))), InvariantViolation);
}

TEST_F(CutLogContractTest, SecondOpenRecordThrows) {
  log_.Append(Open(0, "cam1", At(0, "01:00:00;00")));
  EXPECT_THROW(log_.Append(Open(1, "cam2", At(1'000'000, "01:00:01;00"))), InvariantViolation);
}

TEST_F(CutLogContractTest, DiscontinuousRecordInThrows) {
  log_.Append(Open(0, "cam1", At(0, "01:00:00;00")));
  log_.CloseOpen(At(1'000'000, "01:00:01;00"));
  EXPECT_THROW(log_.Append(Open(1, "cam2", At(1'000'000, "01:00:01;02"))), InvariantViolation);
  EXPECT_THROW(log_.Append(Open(1, "cam2", At(1'000'001, "01:00:01;00"))), InvariantViolation);
}

TEST_F(CutLogContractTest, AppendingClosedRecordThrows) {
  CutRecord closed = Open(0, "cam1", At(0, "01:00:00;00"));
  closed.record_out = At(1'000'000, "01:00:01;00");
  EXPECT_THROW(log_.Append(closed), InvariantViolation);
}

TEST_F(CutLogContractTest, CloseWithoutOpenRecordThrows) {
  EXPECT_THROW(log_.CloseOpen(At(0, "01:00:00;00")), InvariantViolation);
}

TEST_F(CutLogContractTest, RecordOutBeforeRecordInThrows) {
  log_.Append(Open(0, "cam1", At(5'000'000, "01:00:05;00")));
  EXPECT_THROW(log_.CloseOpen(At(4'000'000, "01:00:04;00")), InvariantViolation);
  EXPECT_TRUE(log_.HasOpenRecord());
}

TEST_F(CutLogContractTest, FinalizeRequiresClosedRecords) {
  log_.Append(Open(0, "cam1", At(0, "01:00:00;00")));
  EXPECT_THROW(log_.Finalize(), InvariantViolation);
  log_.CloseOpen(At(1'000'000, "01:00:01;00"));
  log_.Finalize();
  EXPECT_TRUE(log_.IsFinalized());
  // Idempotent.
  EXPECT_NO_THROW(log_.Finalize());
}

TEST_F(CutLogContractTest, NoMutationAfterFinalize) {
  log_.Finalize();
  EXPECT_TRUE(log_.Empty());
  EXPECT_THROW(log_.Append(Open(0, "cam1", At(0, "01:00:00;00"))), InvariantViolation);
  EXPECT_THROW(log_.CloseOpen(At(0, "01:00:00;00")), InvariantViolation);
}

TEST_F(CutLogContractTest, ResolveBoundarySetsBothSides) {
  CutBoundary pending;
  pending.observed_us = 2'000'000;
  log_.Append(Open(0, "cam1", At(0, "01:00:00;00")));
  log_.CloseOpen(pending);
  CutRecord next;
  next.sequence_index = 1;
  next.source = devices::SourceId{"cam2", "Cam 2"};
  next.record_in = pending;
  log_.Append(next);
  EXPECT_EQ(log_.UnresolvedBoundaryCount(), 1u);

  log_.ResolveBoundary(1, Df("01:00:02;00"));
  const auto records = log_.Records();
  EXPECT_EQ(records[0].record_out->timecode, Df("01:00:02;00"));
  EXPECT_EQ(records[1].record_in.timecode, Df("01:00:02;00"));
  EXPECT_EQ(log_.UnresolvedBoundaryCount(), 0u);

  // Same value again is a no-op; a different value is a conflict.
  EXPECT_NO_THROW(log_.ResolveBoundary(1, Df("01:00:02;00")));
  EXPECT_THROW(log_.ResolveBoundary(1, Df("01:00:03;00")), InvariantViolation);
  EXPECT_THROW(log_.ResolveBoundary(5, Df("01:00:03;00")), InvariantViolation);
}

TEST_F(CutLogContractTest, ResolveClosingBoundary) {
  CutBoundary pending;
  pending.observed_us = 3'000'000;
  log_.Append(Open(0, "cam1", At(0, "01:00:00;00")));
  log_.CloseOpen(pending);
  ASSERT_EQ(log_.BoundaryCount(), 2u);
  EXPECT_FALSE(log_.BoundaryAt(1)->resolved());

  log_.ResolveBoundary(1, Df("01:00:03;00"));
  EXPECT_TRUE(log_.BoundaryAt(1)->resolved());
  EXPECT_EQ(log_.Records()[0].DurationFrames(), 90);
}

TEST_F(CutLogContractTest, DurationCountsForwardThroughMidnight) {
  CutRecord record;
  record.record_in.observed_us = 0;
  record.record_in.timecode = Timecode::Parse("23:59:59:00", timecode::FPS_30, false);
  CutBoundary out;
  out.observed_us = 2'000'000;
  out.timecode = Timecode::Parse("00:00:01:00", timecode::FPS_30, false);
  record.record_out = out;
  EXPECT_EQ(record.DurationFrames(), 60);

  CutRecord df;
  df.record_in = At(0, "23:59:59;28");
  df.record_out = At(100'000, "00:00:00;02");
  EXPECT_EQ(df.DurationFrames(), 4);
}

}  // namespace
}  // namespace cutlog::correlator::testing
