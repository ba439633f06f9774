// Repository: CutLog
// Component: Recorder Transport Info Parser
// Copyright (c) 2026 CutLog

#include "cutlog/devices/TransportInfoParser.h"

#include <cctype>
#include <sstream>

#include "cutlog/util/Logger.hpp"

namespace cutlog::devices {

namespace {

std::string Trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::string Lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::optional<int> ParseInt(const std::string& s) {
  if (s.empty()) return std::nullopt;
  size_t i = (s[0] == '-') ? 1 : 0;
  if (i == s.size()) return std::nullopt;
  for (size_t k = i; k < s.size(); ++k) {
    if (!std::isdigit(static_cast<unsigned char>(s[k]))) return std::nullopt;
  }
  if (s.size() > 6) return std::nullopt;
  return std::stoi(s);
}

}  // namespace

TransportState TransportInfoParser::MapStatus(const std::string& status,
                                              std::optional<int> speed) {
  const std::string s = Lower(Trim(status));
  if (s == "play" || s == "record") {
    return (speed.has_value() && *speed == 0) ? TransportState::kPaused
                                              : TransportState::kPlaying;
  }
  if (s == "stopped") return TransportState::kStopped;
  if (s == "preview") return TransportState::kPaused;
  if (s == "shuttle" || s == "jog" || s == "forward" || s == "rewind") {
    return TransportState::kShuttling;
  }
  return TransportState::kUnknown;
}

std::optional<TimecodeTick> TransportInfoParser::Parse(const std::string& response,
                                                       int64_t observed_us) const {
  std::string status;
  std::optional<int> speed;
  std::string display_tc;
  std::string plain_tc;

  std::istringstream in(response);
  std::string line;
  while (std::getline(in, line)) {
    const size_t colon = line.find(':');
    if (colon == std::string::npos) continue;
    const std::string key = Lower(Trim(line.substr(0, colon)));
    const std::string value = Trim(line.substr(colon + 1));
    if (key == "status") {
      status = value;
    } else if (key == "speed") {
      speed = ParseInt(value);
    } else if (key == "display timecode") {
      display_tc = value;
    } else if (key == "timecode") {
      plain_tc = value;
    }
  }

  const std::string& tc_text = !display_tc.empty() ? display_tc : plain_tc;
  if (tc_text.empty()) {
    return std::nullopt;
  }
  const auto tc = timecode::Timecode::Parse(tc_text, rate_, drop_frame_);
  if (!tc.has_value()) {
    util::Logger::Debug("[TransportInfoParser] Unparseable timecode '" + tc_text + "'");
    return std::nullopt;
  }

  TimecodeTick tick;
  tick.timecode = *tc;
  tick.transport_state = MapStatus(status, speed);
  tick.observed_us = observed_us;
  return tick;
}

}  // namespace cutlog::devices
