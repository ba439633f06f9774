// Repository: CutLog
// Component: Replay Script
// Copyright (c) 2026 CutLog

#include "ReplayScript.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace cutlog::standalone {

namespace {

bool ParseMs(const std::string& word, int64_t* out_us) {
  if (word.empty() || word.size() > 15) return false;
  for (char c : word) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  *out_us = std::stoll(word) * 1'000;
  return true;
}

ReplayParseResult Fail(int line, const std::string& error) {
  return {false, {}, line, error};
}

}  // namespace

int64_t ReplayScript::StopInstantUs() const {
  if (stop_us.has_value()) return *stop_us;
  int64_t latest = 0;
  for (const auto& t : ticks) latest = std::max(latest, t.observed_us);
  for (const auto& s : sources) latest = std::max(latest, s.observed_us);
  return latest;
}

std::optional<devices::TransportState> ParseTransportState(const std::string& word) {
  if (word == "playing" || word == "play" || word == "record") {
    return devices::TransportState::kPlaying;
  }
  if (word == "stopped") return devices::TransportState::kStopped;
  if (word == "paused") return devices::TransportState::kPaused;
  if (word == "shuttling") return devices::TransportState::kShuttling;
  if (word == "unknown") return devices::TransportState::kUnknown;
  return std::nullopt;
}

ReplayParseResult ParseReplayScript(std::istream& in,
                                    const timecode::RationalFps& rate,
                                    bool drop_frame) {
  ReplayScript script;
  std::string line;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::istringstream words(line);
    std::string kind;
    if (!(words >> kind) || kind[0] == '#') continue;

    std::string ms_word;
    int64_t observed_us = 0;
    if (!(words >> ms_word) || !ParseMs(ms_word, &observed_us)) {
      return Fail(line_no, "expected time in milliseconds");
    }

    if (kind == "tick") {
      std::string tc_word;
      std::string state_word;
      if (!(words >> tc_word >> state_word)) {
        return Fail(line_no, "tick needs <timecode> <state>");
      }
      const auto tc = timecode::Timecode::Parse(tc_word, rate, drop_frame);
      if (!tc.has_value()) {
        return Fail(line_no, "bad timecode '" + tc_word + "'");
      }
      const auto state = ParseTransportState(state_word);
      if (!state.has_value()) {
        return Fail(line_no, "bad transport state '" + state_word + "'");
      }
      devices::TimecodeTick tick;
      tick.timecode = *tc;
      tick.transport_state = *state;
      tick.observed_us = observed_us;
      script.ticks.push_back(tick);
    } else if (kind == "source") {
      devices::SourceChanged change;
      change.observed_us = observed_us;
      if (!(words >> change.source.id)) {
        return Fail(line_no, "source needs <id>");
      }
      std::string rest;
      std::getline(words, rest);
      const size_t b = rest.find_first_not_of(" \t");
      change.source.label = (b == std::string::npos) ? change.source.id : rest.substr(b);
      script.sources.push_back(change);
    } else if (kind == "stop") {
      script.stop_us = observed_us;
    } else {
      return Fail(line_no, "unknown event '" + kind + "'");
    }
  }
  return {true, std::move(script), 0, ""};
}

}  // namespace cutlog::standalone
