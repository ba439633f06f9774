#pragma once
#include "cutlog/time/ITimeSource.hpp"
#include <chrono>

namespace cutlog {

class SystemTimeSource : public ITimeSource {
public:
  int64_t NowUs() const override {
    using namespace std::chrono;
    return duration_cast<microseconds>(
        steady_clock::now().time_since_epoch()).count();
  }
};

}  // namespace cutlog
