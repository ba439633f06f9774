// Repository: CutLog
// Component: Replay Script
// Purpose: Text event scripts for the cutlog_replay harness
// Copyright (c) 2026 CutLog
//
// Script grammar, one event per line, times in milliseconds:
//
//   # comment
//   tick   <ms> <timecode> <playing|stopped|paused|shuttling|unknown>
//   source <ms> <id> <label words...>
//   stop   <ms>

#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "cutlog/devices/DeviceEvents.hpp"
#include "cutlog/timecode/RationalFps.hpp"

namespace cutlog::standalone {

struct ReplayScript {
  std::vector<devices::TimecodeTick> ticks;
  std::vector<devices::SourceChanged> sources;
  std::optional<int64_t> stop_us;

  // Explicit stop, else the latest event instant.
  int64_t StopInstantUs() const;
};

struct ReplayParseResult {
  bool ok;
  ReplayScript script;
  int error_line;
  std::string error;
};

ReplayParseResult ParseReplayScript(std::istream& in,
                                    const timecode::RationalFps& rate,
                                    bool drop_frame);

std::optional<devices::TransportState> ParseTransportState(const std::string& word);

}  // namespace cutlog::standalone
