// Repository: CutLog
// Component: Replay Script Contract Tests
// Copyright (c) 2026 CutLog

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "ReplayScript.hpp"

namespace cutlog::standalone::testing {
namespace {

using timecode::FPS_2997;

TEST(ReplayScriptContract, ParsesEveryEventKind) {
  std::istringstream in(
      "# studio A rehearsal\n"
      "tick 0 01:00:00;00 playing\n"
      "\n"
      "source 0 1 Cam 1\n"
      "tick 1000 01:00:00;29 play\n"
      "source 1500 vt2\n"
      "stop 3000\n");
  const auto result = ParseReplayScript(in, FPS_2997, true);
  ASSERT_TRUE(result.ok) << result.error;

  ASSERT_EQ(result.script.ticks.size(), 2u);
  EXPECT_EQ(result.script.ticks[1].observed_us, 1'000'000);
  EXPECT_EQ(result.script.ticks[1].timecode.ToString(), "01:00:00;29");
  EXPECT_EQ(result.script.ticks[1].transport_state, devices::TransportState::kPlaying);

  ASSERT_EQ(result.script.sources.size(), 2u);
  EXPECT_EQ(result.script.sources[0].source.id, "1");
  EXPECT_EQ(result.script.sources[0].source.label, "Cam 1");
  EXPECT_EQ(result.script.sources[1].source.label, "vt2");
  EXPECT_EQ(result.script.sources[1].observed_us, 1'500'000);

  EXPECT_EQ(result.script.StopInstantUs(), 3'000'000);
}

TEST(ReplayScriptContract, StopDefaultsToLatestEvent) {
  std::istringstream in("tick 200 01:00:00;00 stopped\nsource 900 1 Cam 1\n");
  const auto result = ParseReplayScript(in, FPS_2997, true);
  ASSERT_TRUE(result.ok);
  EXPECT_FALSE(result.script.stop_us.has_value());
  EXPECT_EQ(result.script.StopInstantUs(), 900'000);
}

TEST(ReplayScriptContract, ReportsOffendingLine) {
  std::istringstream bad_tc("tick 0 01:00:00;00 playing\ntick 40 00:01:00;00 playing\n");
  const auto tc_result = ParseReplayScript(bad_tc, FPS_2997, true);
  EXPECT_FALSE(tc_result.ok);
  EXPECT_EQ(tc_result.error_line, 2);

  std::istringstream bad_state("tick 0 01:00:00;00 rewinding\n");
  EXPECT_FALSE(ParseReplayScript(bad_state, FPS_2997, true).ok);

  std::istringstream bad_time("source -5 1\n");
  EXPECT_FALSE(ParseReplayScript(bad_time, FPS_2997, true).ok);

  std::istringstream bad_kind("cut 0 1\n");
  const auto kind_result = ParseReplayScript(bad_kind, FPS_2997, true);
  EXPECT_FALSE(kind_result.ok);
  EXPECT_EQ(kind_result.error_line, 1);
}

}  // namespace
}  // namespace cutlog::standalone::testing
