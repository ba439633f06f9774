// Repository: CutLog
// Component: Timecode Tracker
// Purpose: Recorder timecode reference; answers "which timecode was in effect at T".
// Copyright (c) 2026 CutLog

#include "cutlog/timing/TimecodeTracker.h"

#include <algorithm>
#include <iterator>
#include <sstream>

#include "cutlog/util/Logger.hpp"

namespace cutlog::timing {

using devices::TransportState;
using timecode::Timecode;

const char* TimecodeEstimateErrorToString(TimecodeEstimateError error) {
  switch (error) {
    case TimecodeEstimateError::kNone:
      return "NONE";
    case TimecodeEstimateError::kNoReferenceAvailable:
      return "NO_REFERENCE_AVAILABLE";
    case TimecodeEstimateError::kStaleReference:
      return "STALE_REFERENCE";
  }
  return "UNKNOWN";
}

TimecodeTracker::TimecodeTracker(TrackerConfig config)
    : config_(config),
      staleness_threshold_us_(config.staleness_threshold_ms * 1'000) {}

bool TimecodeTracker::IsBackwardMoveLocked(const Reading& previous,
                                           const Timecode& next) const {
  const int64_t per_day = Timecode::FramesPerDay(config_.rate, config_.drop_frame);
  const int64_t diff = next.FramesSince(previous.timecode);
  // A jump of more than half a day in either direction is read as a wrap
  // through midnight, not a move.
  if (diff < 0) {
    return diff > -(per_day / 2);
  }
  return diff > per_day / 2;
}

bool TimecodeTracker::RecordTick(const Timecode& tc,
                                 TransportState state,
                                 int64_t observed_us) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (tc.rate() != config_.rate || tc.drop_frame() != config_.drop_frame) {
    ++ticks_rejected_;
    std::ostringstream oss;
    oss << "[TimecodeTracker] Rejected tick " << tc.ToString()
        << " rate=" << tc.rate().num << "/" << tc.rate().den
        << " drop_frame=" << tc.drop_frame()
        << " (expected " << config_.rate.num << "/" << config_.rate.den
        << " drop_frame=" << config_.drop_frame << ")";
    util::Logger::Warn(oss.str());
    return false;
  }

  Reading reading{tc, state, observed_us};
  auto pos = std::upper_bound(
      history_.begin(), history_.end(), observed_us,
      [](int64_t t, const Reading& r) { return t < r.observed_us; });

  if (pos != history_.begin()) {
    const Reading& previous = *std::prev(pos);
    if (IsBackwardMoveLocked(previous, tc)) {
      ++discontinuities_;
      std::ostringstream oss;
      oss << "[TimecodeTracker] DISCONTINUITY: timecode moved backward "
          << previous.timecode.ToString() << " -> " << tc.ToString()
          << " at observed_us=" << observed_us
          << " state=" << devices::TransportStateToString(state)
          << "; accepted as new reference";
      util::Logger::Warn(oss.str());
    }
  }

  history_.insert(pos, reading);
  ++ticks_recorded_;
  if (state == TransportState::kPlaying) {
    ever_playing_ = true;
  }

  while (history_.size() > config_.history_depth && !history_.empty()) {
    if (history_.front().state == TransportState::kPlaying) {
      evicted_playing_ = history_.front();
    }
    history_.pop_front();
  }
  return true;
}

EstimateResult TimecodeTracker::EstimateAt(int64_t instant_us) const {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!ever_playing_) {
    return EstimateResult::Failure(TimecodeEstimateError::kNoReferenceAvailable,
                                   "no PLAYING reading recorded");
  }

  auto after = std::upper_bound(
      history_.begin(), history_.end(), instant_us,
      [](int64_t t, const Reading& r) { return t < r.observed_us; });

  const Reading* at_or_before = (after == history_.begin()) ? nullptr : &*std::prev(after);

  const Reading* playing_before = nullptr;
  for (auto it = after; it != history_.begin();) {
    --it;
    if (it->state == TransportState::kPlaying) {
      playing_before = &*it;
      break;
    }
  }
  if (playing_before == nullptr && evicted_playing_.has_value() &&
      evicted_playing_->observed_us <= instant_us) {
    playing_before = &*evicted_playing_;
  }

  if (playing_before != nullptr) {
    const int64_t age_us = instant_us - playing_before->observed_us;
    if (age_us > staleness_threshold_us_) {
      return EstimateResult::Failure(
          TimecodeEstimateError::kStaleReference,
          "newest PLAYING reading is " + std::to_string(age_us / 1'000) + "ms old");
    }
    if (at_or_before != nullptr && at_or_before->state != TransportState::kPlaying &&
        at_or_before->observed_us >= playing_before->observed_us) {
      return EstimateResult::Success(at_or_before->timecode, EstimateConfidence::kDegraded);
    }
    const int64_t frames = config_.rate.FramesFromDurationFloorUs(age_us);
    return EstimateResult::Success(playing_before->timecode.AddFrames(frames),
                                   EstimateConfidence::kLocked);
  }

  if (at_or_before != nullptr) {
    return EstimateResult::Success(at_or_before->timecode, EstimateConfidence::kDegraded);
  }

  // Instant precedes every reading: back-fill from the first PLAYING one.
  auto next_playing = std::find_if(after, history_.end(), [](const Reading& r) {
    return r.state == TransportState::kPlaying;
  });
  if (next_playing == history_.end()) {
    return EstimateResult::Failure(TimecodeEstimateError::kNoReferenceAvailable,
                                   "no PLAYING reading near instant");
  }
  const int64_t lead_us = next_playing->observed_us - instant_us;
  if (lead_us > staleness_threshold_us_) {
    return EstimateResult::Failure(
        TimecodeEstimateError::kStaleReference,
        "first PLAYING reading is " + std::to_string(lead_us / 1'000) + "ms after instant");
  }
  const int64_t frames = config_.rate.FramesFromDurationFloorUs(-lead_us);
  return EstimateResult::Success(next_playing->timecode.AddFrames(frames),
                                 EstimateConfidence::kLocked);
}

TimecodeTracker::Snapshot TimecodeTracker::GetSnapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Snapshot snap;
  if (!history_.empty()) {
    const Reading& last = history_.back();
    snap.last_timecode = last.timecode;
    snap.last_state = last.state;
    snap.last_observed_us = last.observed_us;
  }
  snap.has_playing_reference = ever_playing_;
  snap.ticks_recorded = ticks_recorded_;
  snap.ticks_rejected = ticks_rejected_;
  snap.discontinuities = discontinuities_;
  return snap;
}

}  // namespace cutlog::timing
