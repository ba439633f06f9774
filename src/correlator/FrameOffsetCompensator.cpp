// Repository: CutLog
// Component: Frame Offset Compensator
// Copyright (c) 2026 CutLog

#include "cutlog/correlator/FrameOffsetCompensator.h"

namespace cutlog::correlator {

const char* CompensatorErrorToString(CompensatorError error) {
  switch (error) {
    case CompensatorError::kNone:
      return "NONE";
    case CompensatorError::kInvalidOffset:
      return "INVALID_OFFSET";
  }
  return "UNKNOWN";
}

CompensatorResult FrameOffsetCompensator::Create(int64_t offset_frames,
                                                 const timecode::RationalFps& rate,
                                                 bool drop_frame) {
  const int64_t per_day = timecode::Timecode::FramesPerDay(rate, drop_frame);
  if (per_day == 0) {
    return CompensatorResult::Failure(CompensatorError::kInvalidOffset,
                                      "unsupported timecode rate " + std::to_string(rate.num) +
                                          "/" + std::to_string(rate.den));
  }
  const int64_t magnitude = offset_frames < 0 ? -offset_frames : offset_frames;
  if (magnitude >= per_day) {
    return CompensatorResult::Failure(
        CompensatorError::kInvalidOffset,
        "offset " + std::to_string(offset_frames) + " frames exceeds the 24h range of " +
            std::to_string(per_day) + " frames");
  }
  return CompensatorResult::Success(FrameOffsetCompensator(offset_frames));
}

}  // namespace cutlog::correlator
