// Repository: CutLog
// Component: Recorder Transport Info Parser
// Purpose: Turns a HyperDeck-style "transport info" response into a TimecodeTick.
// Copyright (c) 2026 CutLog

#ifndef CUTLOG_DEVICES_TRANSPORT_INFO_PARSER_H_
#define CUTLOG_DEVICES_TRANSPORT_INFO_PARSER_H_

#include <cstdint>
#include <optional>
#include <string>

#include "cutlog/devices/DeviceEvents.hpp"
#include "cutlog/timecode/RationalFps.hpp"

namespace cutlog::devices {

// Response shape:
//
//   208 transport info:
//   status: play
//   speed: 100
//   display timecode: 01:00:00:00
//   timecode: 01:00:00:00
//
// "display timecode" wins over "timecode". Status mapping:
//   play / record           → kPlaying (kPaused when speed is 0)
//   stopped                 → kStopped
//   preview                 → kPaused
//   shuttle / jog / forward / rewind → kShuttling
//   anything else           → kUnknown
class TransportInfoParser {
 public:
  TransportInfoParser(const timecode::RationalFps& rate, bool drop_frame)
      : rate_(rate), drop_frame_(drop_frame) {}

  // nullopt if the block has no parseable timecode line.
  std::optional<TimecodeTick> Parse(const std::string& response, int64_t observed_us) const;

  static TransportState MapStatus(const std::string& status, std::optional<int> speed);

 private:
  timecode::RationalFps rate_;
  bool drop_frame_;
};

}  // namespace cutlog::devices

#endif  // CUTLOG_DEVICES_TRANSPORT_INFO_PARSER_H_
