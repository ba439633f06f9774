#ifndef CUTLOG_TIMECODE_RATIONAL_FPS_HPP_
#define CUTLOG_TIMECODE_RATIONAL_FPS_HPP_

#include <cstdint>

namespace cutlog::timecode {

constexpr int64_t FpsAbs64(int64_t v) { return v < 0 ? -v : v; }

constexpr int64_t FpsGcd64(int64_t a, int64_t b) {
  a = FpsAbs64(a);
  b = FpsAbs64(b);
  while (b != 0) {
    const int64_t t = a % b;
    a = b;
    b = t;
  }
  return a == 0 ? 1 : a;
}

// Floor division that rounds toward negative infinity for negative numerators.
constexpr int64_t FloorDiv64(int64_t numer, int64_t denom) {
  const int64_t q = numer / denom;
  return ((numer % denom) != 0 && ((numer < 0) != (denom < 0))) ? q - 1 : q;
}

struct RationalFps {
  int64_t num;
  int64_t den;

  constexpr RationalFps(int64_t n = 0, int64_t d = 1) : num(n), den(d) {
    NormalizeInPlace();
  }

  constexpr bool IsValid() const { return num > 0 && den > 0; }

  constexpr void NormalizeInPlace() {
    if (den == 0) {
      num = 0;
      den = 1;
      return;
    }
    if (den < 0) {
      den = -den;
      num = -num;
    }
    if (num <= 0 || den <= 0) {
      num = 0;
      den = 1;
      return;
    }
    const int64_t g = FpsGcd64(num, den);
    num /= g;
    den /= g;
  }

  // Integer frames-per-second used for HH:MM:SS:FF labelling (29.97 → 30).
  constexpr int64_t NominalFps() const {
    return IsValid() ? ((num + den / 2) / den) : 0;
  }

  // 1000/1001 rates: 23.976, 29.97, 59.94.
  constexpr bool IsNtscRate() const { return den == 1001; }

  // Whole frames elapsed in delta_us of real time. Negative deltas floor
  // toward the earlier frame.
  constexpr int64_t FramesFromDurationFloorUs(int64_t delta_us) const {
    return IsValid() ? FloorDiv64(delta_us * num, den * 1000000LL) : 0;
  }

  constexpr bool operator==(const RationalFps& other) const {
    return num == other.num && den == other.den;
  }
  constexpr bool operator!=(const RationalFps& other) const {
    return !(*this == other);
  }
};

constexpr RationalFps FPS_23976{24000, 1001};
constexpr RationalFps FPS_24{24, 1};
constexpr RationalFps FPS_25{25, 1};
constexpr RationalFps FPS_2997{30000, 1001};
constexpr RationalFps FPS_30{30, 1};
constexpr RationalFps FPS_50{50, 1};
constexpr RationalFps FPS_5994{60000, 1001};
constexpr RationalFps FPS_60{60, 1};

}  // namespace cutlog::timecode

#endif  // CUTLOG_TIMECODE_RATIONAL_FPS_HPP_
