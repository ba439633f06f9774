#pragma once
#include <cstdint>

namespace cutlog {

// Host clock shared by both device streams. Every observedAt instant in the
// engine is expressed on this clock, in microseconds.
class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUs() const = 0;
};

}  // namespace cutlog
