// Repository: CutLog
// Component: Capture Configuration
// Purpose: Per-session engine settings
// Copyright (c) 2026 CutLog

#ifndef CUTLOG_RUNTIME_CAPTURE_CONFIG_H_
#define CUTLOG_RUNTIME_CAPTURE_CONFIG_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "cutlog/edl/EdlExporter.h"
#include "cutlog/timecode/RationalFps.hpp"
#include "cutlog/timing/TimecodeTracker.h"

namespace cutlog::runtime {

struct CaptureConfig {
  timecode::RationalFps frame_rate = timecode::FPS_2997;
  bool drop_frame = true;
  // Signed frames added to every captured timecode.
  int64_t frame_offset = 0;
  int64_t staleness_threshold_ms = 2'000;
  bool reject_empty_export = false;

  // Per device stream.
  size_t channel_capacity = 1'024;
  // Hold drained events this long so late arrivals can be merged in
  // observed order. 0 applies every drained batch immediately.
  int64_t reorder_window_ms = 0;
  size_t tick_history_depth = 256;
  std::string edl_title = "Program Output";

  struct Validation {
    bool valid;
    std::vector<std::string> errors;
  };

  Validation Validate() const;

  timing::TrackerConfig ToTrackerConfig() const;
  edl::EdlExportConfig ToExportConfig() const;
};

// "23.976", "24", "25", "29.97", "30", "50", "59.94", "60" (also "2997"
// style and "30000/1001" rationals). nullopt for anything else.
std::optional<timecode::RationalFps> ParseFrameRate(const std::string& text);

std::string FrameRateToString(const timecode::RationalFps& rate);

}  // namespace cutlog::runtime

#endif  // CUTLOG_RUNTIME_CAPTURE_CONFIG_H_
