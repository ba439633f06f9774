// Repository: CutLog
// Component: SMPTE Timecode
// Purpose: HH:MM:SS:FF values at a fixed rate with drop-frame aware arithmetic.
// Copyright (c) 2026 CutLog

#include "cutlog/timecode/Timecode.hpp"

#include <cctype>
#include <stdexcept>

extern "C" {
#include <libavutil/rational.h>
#include <libavutil/timecode.h>
}

namespace cutlog::timecode {

namespace {

// Labels skipped at the start of each non-tenth minute (2 at 29.97, 4 at 59.94).
int64_t DroppedLabelsPerMinute(const RationalFps& rate) {
  return rate.NominalFps() / 15;
}

AVRational ToAVRational(const RationalFps& rate) {
  return AVRational{static_cast<int>(rate.num), static_cast<int>(rate.den)};
}

int TimecodeFlags(bool drop_frame) {
  int flags = AV_TIMECODE_FLAG_24HOURSMAX;
  if (drop_frame) {
    flags |= AV_TIMECODE_FLAG_DROPFRAME;
  }
  return flags;
}

bool ParseTwoDigits(const std::string& text, size_t pos, int* out) {
  if (pos + 1 >= text.size()) return false;
  const unsigned char hi = static_cast<unsigned char>(text[pos]);
  const unsigned char lo = static_cast<unsigned char>(text[pos + 1]);
  if (!std::isdigit(hi) || !std::isdigit(lo)) return false;
  *out = (hi - '0') * 10 + (lo - '0');
  return true;
}

bool IsFieldSeparator(char c) { return c == ':' || c == ';'; }

bool IsFrameSeparator(char c) {
  return c == ':' || c == ';' || c == '.' || c == ',';
}

}  // namespace

bool Timecode::IsSupportedFormat(const RationalFps& rate, bool drop_frame) {
  if (!rate.IsValid()) return false;
  const int64_t nominal = rate.NominalFps();
  if (nominal <= 0 || nominal > 60) return false;
  if (drop_frame) {
    return rate.IsNtscRate() && (nominal % 30) == 0;
  }
  return true;
}

int64_t Timecode::FramesPerDay(const RationalFps& rate, bool drop_frame) {
  if (!IsSupportedFormat(rate, drop_frame)) return 0;
  const int64_t nominal = rate.NominalFps();
  if (!drop_frame) {
    return nominal * 86400;
  }
  // 144 ten-minute blocks per day; nine of every ten minutes drop labels.
  const int64_t per_ten_minutes = nominal * 600 - DroppedLabelsPerMinute(rate) * 9;
  return per_ten_minutes * 144;
}

std::optional<Timecode> Timecode::FromFrames(int64_t frames,
                                             const RationalFps& rate,
                                             bool drop_frame) {
  const int64_t per_day = FramesPerDay(rate, drop_frame);
  if (per_day == 0) return std::nullopt;
  int64_t wrapped = frames % per_day;
  if (wrapped < 0) wrapped += per_day;
  return Timecode(wrapped, rate, drop_frame);
}

std::optional<Timecode> Timecode::FromComponents(const TimecodeComponents& c,
                                                 const RationalFps& rate,
                                                 bool drop_frame) {
  if (!IsSupportedFormat(rate, drop_frame)) return std::nullopt;
  const int64_t nominal = rate.NominalFps();
  if (c.hours < 0 || c.hours > 23 || c.minutes < 0 || c.minutes > 59 ||
      c.seconds < 0 || c.seconds > 59 || c.frames < 0 || c.frames >= nominal) {
    return std::nullopt;
  }
  if (drop_frame && c.seconds == 0 && (c.minutes % 10) != 0 &&
      c.frames < DroppedLabelsPerMinute(rate)) {
    return std::nullopt;
  }

  AVTimecode tc;
  if (av_timecode_init_from_components(&tc, ToAVRational(rate), TimecodeFlags(drop_frame),
                                       c.hours, c.minutes, c.seconds, c.frames,
                                       nullptr) < 0) {
    return std::nullopt;
  }
  return Timecode(tc.start, rate, drop_frame);
}

std::optional<Timecode> Timecode::Parse(const std::string& text,
                                        const RationalFps& rate,
                                        bool drop_frame) {
  if (text.size() != 11) return std::nullopt;
  if (!IsFieldSeparator(text[2]) || !IsFieldSeparator(text[5]) ||
      !IsFrameSeparator(text[8])) {
    return std::nullopt;
  }
  TimecodeComponents c;
  if (!ParseTwoDigits(text, 0, &c.hours) || !ParseTwoDigits(text, 3, &c.minutes) ||
      !ParseTwoDigits(text, 6, &c.seconds) || !ParseTwoDigits(text, 9, &c.frames)) {
    return std::nullopt;
  }
  return FromComponents(c, rate, drop_frame);
}

Timecode Timecode::AddFrames(int64_t delta) const {
  const int64_t per_day = FramesPerDay(rate_, drop_frame_);
  int64_t wrapped = (frames_ + delta % per_day) % per_day;
  if (wrapped < 0) wrapped += per_day;
  return Timecode(wrapped, rate_, drop_frame_);
}

TimecodeComponents Timecode::ToComponents() const {
  const int nominal = static_cast<int>(rate_.NominalFps());
  int label = static_cast<int>(frames_);
  if (drop_frame_) {
    label = av_timecode_adjust_ntsc_framenum2(label, nominal);
  }
  TimecodeComponents c;
  c.frames = label % nominal;
  c.seconds = (label / nominal) % 60;
  c.minutes = (label / (nominal * 60)) % 60;
  c.hours = (label / (nominal * 3600)) % 24;
  return c;
}

std::string Timecode::ToString() const {
  AVTimecode tc;
  if (av_timecode_init(&tc, ToAVRational(rate_), TimecodeFlags(drop_frame_), 0, nullptr) < 0) {
    throw std::logic_error("Timecode: libavutil rejected rate " + std::to_string(rate_.num) +
                           "/" + std::to_string(rate_.den));
  }
  char buf[AV_TIMECODE_STR_SIZE];
  av_timecode_make_string(&tc, buf, static_cast<int>(frames_));
  return std::string(buf);
}

}  // namespace cutlog::timecode
