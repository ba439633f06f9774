// Repository: CutLog
// Component: Frame Offset Compensator
// Purpose: Fixed signed frame correction for known transport/network latency.
// Copyright (c) 2026 CutLog

#ifndef CUTLOG_CORRELATOR_FRAME_OFFSET_COMPENSATOR_H_
#define CUTLOG_CORRELATOR_FRAME_OFFSET_COMPENSATOR_H_

#include <cstdint>
#include <optional>
#include <string>

#include "cutlog/timecode/RationalFps.hpp"
#include "cutlog/timecode/Timecode.hpp"

namespace cutlog::correlator {

enum class CompensatorError {
  kNone = 0,
  // |offset| reaches a full day of frames at the session rate.
  kInvalidOffset,
};

const char* CompensatorErrorToString(CompensatorError error);

class FrameOffsetCompensator;

struct CompensatorResult;

// Positive offset: recorder ahead. Negative: recorder behind.
// Compensate(tc) == tc + offset frames, rolling over at 24 hours.
// The offset is validated once in Create(); Compensate() never fails.
class FrameOffsetCompensator {
 public:
  static CompensatorResult Create(int64_t offset_frames,
                                  const timecode::RationalFps& rate,
                                  bool drop_frame);

  timecode::Timecode Compensate(const timecode::Timecode& tc) const {
    return tc.AddFrames(offset_frames_);
  }

  FrameOffsetCompensator Inverse() const { return FrameOffsetCompensator(-offset_frames_); }

  int64_t offset_frames() const { return offset_frames_; }

 private:
  explicit FrameOffsetCompensator(int64_t offset_frames) : offset_frames_(offset_frames) {}

  int64_t offset_frames_;
};

struct CompensatorResult {
  bool ok;
  CompensatorError error;
  std::optional<FrameOffsetCompensator> compensator;
  std::string detail;

  static CompensatorResult Success(FrameOffsetCompensator c) {
    return {true, CompensatorError::kNone, c, ""};
  }

  static CompensatorResult Failure(CompensatorError err, const std::string& detail = "") {
    return {false, err, std::nullopt, detail};
  }
};

}  // namespace cutlog::correlator

#endif  // CUTLOG_CORRELATOR_FRAME_OFFSET_COMPENSATOR_H_
