// Repository: CutLog
// Component: Device Events
// Purpose: Event types produced by the switcher and recorder collaborators.
// Copyright (c) 2026 CutLog

#ifndef CUTLOG_DEVICES_DEVICE_EVENTS_HPP_
#define CUTLOG_DEVICES_DEVICE_EVENTS_HPP_

#include <cstdint>
#include <string>

#include "cutlog/timecode/Timecode.hpp"

namespace cutlog::devices {

// Only kPlaying readings are a trusted reference for extrapolation.
enum class TransportState : int32_t {
  kStopped = 0,
  kPlaying = 1,
  kPaused = 2,
  kShuttling = 3,
  kUnknown = 4,
};

const char* TransportStateToString(TransportState state);

// Switcher input. `id` is the stable key; `label` is what the operator sees
// and what ends up in the EDL reel / clip name.
struct SourceId {
  std::string id;
  std::string label;

  bool operator==(const SourceId& other) const { return id == other.id; }
  bool operator!=(const SourceId& other) const { return !(*this == other); }
};

// Program input changed on the switcher.
struct SourceChanged {
  SourceId source;
  int64_t observed_us = 0;
};

// Recorder status reading.
struct TimecodeTick {
  timecode::Timecode timecode;
  TransportState transport_state = TransportState::kUnknown;
  int64_t observed_us = 0;
};

// Boundary through which the excluded device-connection collaborators hand
// events to the engine. Implementations must not block the caller.
class IDeviceEventSink {
 public:
  virtual ~IDeviceEventSink() = default;

  // Returns false if the event was not accepted (session stopped, channel full).
  virtual bool OnSourceChanged(const SourceChanged& event) = 0;
  virtual bool OnTimecodeTick(const TimecodeTick& tick) = 0;
};

}  // namespace cutlog::devices

#endif  // CUTLOG_DEVICES_DEVICE_EVENTS_HPP_
