// Repository: CutLog
// Component: Device Events
// Copyright (c) 2026 CutLog

#include "cutlog/devices/DeviceEvents.hpp"

namespace cutlog::devices {

const char* TransportStateToString(TransportState state) {
  switch (state) {
    case TransportState::kStopped:
      return "STOPPED";
    case TransportState::kPlaying:
      return "PLAYING";
    case TransportState::kPaused:
      return "PAUSED";
    case TransportState::kShuttling:
      return "SHUTTLING";
    case TransportState::kUnknown:
      return "UNKNOWN";
  }
  return "UNKNOWN";
}

}  // namespace cutlog::devices
