// Repository: CutLog
// Component: SMPTE Timecode
// Purpose: HH:MM:SS:FF values at a fixed rate with drop-frame aware arithmetic.
// Copyright (c) 2026 CutLog

#ifndef CUTLOG_TIMECODE_TIMECODE_HPP_
#define CUTLOG_TIMECODE_TIMECODE_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "cutlog/timecode/RationalFps.hpp"

namespace cutlog::timecode {

struct TimecodeComponents {
  int hours = 0;
  int minutes = 0;
  int seconds = 0;
  int frames = 0;
};

// Timecode is stored as a counted frame number since 00:00:00:00 in
// [0, FramesPerDay). For drop-frame formats the counted frame number is the
// real frame count; the skipped labels (;00 and ;01 of every minute not
// divisible by ten at 29.97, ;00-;03 at 59.94) exist only in the text form.
// Arithmetic is therefore plain integer arithmetic modulo one day, and
// crossing a drop-frame minute needs no special casing.
class Timecode {
 public:
  Timecode() = default;

  // True when HH:MM:SS:FF can be expressed at `rate`. Drop-frame is only
  // defined for 1000/1001 rates whose nominal rate is a multiple of 30.
  static bool IsSupportedFormat(const RationalFps& rate, bool drop_frame);

  // Counted frames in 24 hours (2589408 at 29.97 drop-frame).
  static int64_t FramesPerDay(const RationalFps& rate, bool drop_frame);

  // Wraps `frames` into the 24-hour range. nullopt for an unsupported format.
  static std::optional<Timecode> FromFrames(int64_t frames,
                                            const RationalFps& rate,
                                            bool drop_frame);

  // nullopt on out-of-range fields and on labels a drop-frame counter skips.
  static std::optional<Timecode> FromComponents(const TimecodeComponents& c,
                                                const RationalFps& rate,
                                                bool drop_frame);

  // Accepts HH:MM:SS:FF with ':' ';' '.' or ',' before the frame field.
  // The separator is informational; `drop_frame` decides the counting mode.
  static std::optional<Timecode> Parse(const std::string& text,
                                       const RationalFps& rate,
                                       bool drop_frame);

  int64_t frames() const { return frames_; }
  const RationalFps& rate() const { return rate_; }
  bool drop_frame() const { return drop_frame_; }

  // Signed frame arithmetic with rollover at 24 hours.
  Timecode AddFrames(int64_t delta) const;
  Timecode SubtractFrames(int64_t delta) const { return AddFrames(-delta); }

  // this - earlier, in frames, without wrap handling.
  int64_t FramesSince(const Timecode& earlier) const { return frames_ - earlier.frames_; }

  TimecodeComponents ToComponents() const;

  // "01:00:00:00", or "01:00:00;00" for drop-frame.
  std::string ToString() const;

  bool operator==(const Timecode& other) const {
    return frames_ == other.frames_ && rate_ == other.rate_ &&
           drop_frame_ == other.drop_frame_;
  }
  bool operator!=(const Timecode& other) const { return !(*this == other); }
  bool operator<(const Timecode& other) const { return frames_ < other.frames_; }
  bool operator<=(const Timecode& other) const { return frames_ <= other.frames_; }
  bool operator>(const Timecode& other) const { return frames_ > other.frames_; }
  bool operator>=(const Timecode& other) const { return frames_ >= other.frames_; }

 private:
  Timecode(int64_t frames, const RationalFps& rate, bool drop_frame)
      : frames_(frames), rate_(rate), drop_frame_(drop_frame) {}

  int64_t frames_ = 0;
  RationalFps rate_ = FPS_30;
  bool drop_frame_ = false;
};

}  // namespace cutlog::timecode

#endif  // CUTLOG_TIMECODE_TIMECODE_HPP_
