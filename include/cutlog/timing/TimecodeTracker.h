// Repository: CutLog
// Component: Timecode Tracker
// Purpose: Recorder timecode reference; answers "which timecode was in effect at T".
// Copyright (c) 2026 CutLog

#ifndef CUTLOG_TIMING_TIMECODE_TRACKER_H_
#define CUTLOG_TIMING_TIMECODE_TRACKER_H_

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "cutlog/devices/DeviceEvents.hpp"
#include "cutlog/timecode/RationalFps.hpp"
#include "cutlog/timecode/Timecode.hpp"

namespace cutlog::timing {

enum class TimecodeEstimateError {
  kNone = 0,

  // No kPlaying reading has ever been recorded.
  kNoReferenceAvailable,

  // The kPlaying reading nearest the instant is older than the threshold.
  kStaleReference,
};

const char* TimecodeEstimateErrorToString(TimecodeEstimateError error);

enum class EstimateConfidence {
  // Extrapolated from a kPlaying reading.
  kLocked,
  // Transport is not playing; the last known value is served frozen.
  kDegraded,
};

struct EstimateResult {
  bool ok;
  TimecodeEstimateError error;
  std::optional<timecode::Timecode> timecode;
  EstimateConfidence confidence;
  std::string detail;

  static EstimateResult Success(const timecode::Timecode& tc, EstimateConfidence confidence) {
    return {true, TimecodeEstimateError::kNone, tc, confidence, ""};
  }

  static EstimateResult Failure(TimecodeEstimateError err, const std::string& detail = "") {
    return {false, err, std::nullopt, EstimateConfidence::kDegraded, detail};
  }
};

struct TrackerConfig {
  timecode::RationalFps rate = timecode::FPS_2997;
  bool drop_frame = true;
  int64_t staleness_threshold_ms = 2'000;
  // Readings retained for estimates at past instants.
  size_t history_depth = 256;
};

// TimecodeTracker keeps a bounded, observed-time-ordered history of recorder
// readings.
//
// EstimateAt(t):
//   - latest kPlaying reading P at or before t: P.timecode extrapolated by
//     the wall-clock time t - P.observed at the device rate, unless a
//     non-playing reading arrived after P (then that value, frozen, kDegraded)
//   - no kPlaying reading at or before t: a non-playing reading at or before
//     t is served frozen; otherwise the earliest kPlaying reading after t is
//     extrapolated backward
//   - the reference reading must lie within staleness_threshold_ms of t
//
// Backward moves (recorder loop points, clock jumps) are accepted as the new
// reference and counted as discontinuities.
//
// Thread-safety: RecordTick is called from the session sequencer only.
// EstimateAt and GetSnapshot may be called from any thread; they never
// mutate tracker state.
class TimecodeTracker {
 public:
  explicit TimecodeTracker(TrackerConfig config = TrackerConfig());

  TimecodeTracker(const TimecodeTracker&) = delete;
  TimecodeTracker& operator=(const TimecodeTracker&) = delete;

  // Returns false (and records nothing) if the reading's rate or counting
  // mode differs from the configured one.
  bool RecordTick(const timecode::Timecode& tc,
                  devices::TransportState state,
                  int64_t observed_us);

  EstimateResult EstimateAt(int64_t instant_us) const;

  struct Snapshot {
    std::optional<timecode::Timecode> last_timecode;
    devices::TransportState last_state = devices::TransportState::kUnknown;
    std::optional<int64_t> last_observed_us;
    bool has_playing_reference = false;
    uint64_t ticks_recorded = 0;
    uint64_t ticks_rejected = 0;
    uint64_t discontinuities = 0;
  };

  Snapshot GetSnapshot() const;

  const TrackerConfig& config() const { return config_; }

 private:
  struct Reading {
    timecode::Timecode timecode;
    devices::TransportState state;
    int64_t observed_us;
  };

  bool IsBackwardMoveLocked(const Reading& previous, const timecode::Timecode& next) const;

  const TrackerConfig config_;
  const int64_t staleness_threshold_us_;

  mutable std::mutex mutex_;
  std::deque<Reading> history_;
  // Newest kPlaying reading evicted from history_, kept as a reference for
  // instants older than the retained window.
  std::optional<Reading> evicted_playing_;
  bool ever_playing_ = false;
  uint64_t ticks_recorded_ = 0;
  uint64_t ticks_rejected_ = 0;
  uint64_t discontinuities_ = 0;
};

}  // namespace cutlog::timing

#endif  // CUTLOG_TIMING_TIMECODE_TRACKER_H_
