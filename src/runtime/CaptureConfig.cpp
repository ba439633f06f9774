// Repository: CutLog
// Component: Capture Configuration
// Copyright (c) 2026 CutLog

#include "cutlog/runtime/CaptureConfig.h"

#include <cctype>

#include "cutlog/correlator/FrameOffsetCompensator.h"
#include "cutlog/timecode/Timecode.hpp"

namespace cutlog::runtime {

namespace {

bool AllDigits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

}  // namespace

CaptureConfig::Validation CaptureConfig::Validate() const {
  Validation v{true, {}};
  auto fail = [&v](const std::string& msg) {
    v.valid = false;
    v.errors.push_back(msg);
  };

  if (!frame_rate.IsValid()) {
    fail("frame_rate must be positive");
  } else if (!timecode::Timecode::IsSupportedFormat(frame_rate, drop_frame)) {
    fail("drop_frame requires 29.97 or 59.94, got " + FrameRateToString(frame_rate));
  } else {
    const auto comp =
        correlator::FrameOffsetCompensator::Create(frame_offset, frame_rate, drop_frame);
    if (!comp.ok) {
      fail(std::string(correlator::CompensatorErrorToString(comp.error)) + ": " + comp.detail);
    }
  }
  if (staleness_threshold_ms <= 0) {
    fail("staleness_threshold_ms must be > 0");
  }
  if (channel_capacity == 0) {
    fail("channel_capacity must be > 0");
  }
  if (reorder_window_ms < 0) {
    fail("reorder_window_ms must be >= 0");
  }
  if (tick_history_depth == 0) {
    fail("tick_history_depth must be > 0");
  }
  return v;
}

timing::TrackerConfig CaptureConfig::ToTrackerConfig() const {
  timing::TrackerConfig cfg;
  cfg.rate = frame_rate;
  cfg.drop_frame = drop_frame;
  cfg.staleness_threshold_ms = staleness_threshold_ms;
  cfg.history_depth = tick_history_depth;
  return cfg;
}

edl::EdlExportConfig CaptureConfig::ToExportConfig() const {
  edl::EdlExportConfig cfg;
  cfg.title = edl_title;
  cfg.reject_empty_export = reject_empty_export;
  return cfg;
}

std::optional<timecode::RationalFps> ParseFrameRate(const std::string& text) {
  if (text == "23.976" || text == "23.98") return timecode::FPS_23976;
  if (text == "24") return timecode::FPS_24;
  if (text == "25") return timecode::FPS_25;
  if (text == "29.97" || text == "2997") return timecode::FPS_2997;
  if (text == "30") return timecode::FPS_30;
  if (text == "50") return timecode::FPS_50;
  if (text == "59.94" || text == "5994") return timecode::FPS_5994;
  if (text == "60") return timecode::FPS_60;

  const size_t slash = text.find('/');
  if (slash == std::string::npos) return std::nullopt;
  const std::string num = text.substr(0, slash);
  const std::string den = text.substr(slash + 1);
  if (!AllDigits(num) || !AllDigits(den) || num.size() > 9 || den.size() > 9) {
    return std::nullopt;
  }
  timecode::RationalFps rate(std::stoll(num), std::stoll(den));
  if (!rate.IsValid()) return std::nullopt;
  return rate;
}

std::string FrameRateToString(const timecode::RationalFps& rate) {
  if (rate == timecode::FPS_23976) return "23.976";
  if (rate == timecode::FPS_2997) return "29.97";
  if (rate == timecode::FPS_5994) return "59.94";
  if (rate.den == 1) return std::to_string(rate.num);
  return std::to_string(rate.num) + "/" + std::to_string(rate.den);
}

}  // namespace cutlog::runtime
