// Repository: CutLog
// Component: EDL Exporter
// Purpose: Serializes a finalized Cut Log as a CMX3600-style edit decision list.
// Copyright (c) 2026 CutLog

#include "cutlog/edl/EdlExporter.h"

#include <cctype>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

#include "cutlog/util/Logger.hpp"

namespace cutlog::edl {

namespace {

constexpr size_t kReelWidth = 8;
constexpr size_t kTrackWidth = 5;
constexpr size_t kTitleMax = 70;
// Three-digit event number column.
constexpr size_t kMaxEvents = 999;

std::string PadRight(const std::string& s, size_t width) {
  if (s.size() >= width) return s;
  return s + std::string(width - s.size(), ' ');
}

// Title and clip names are single-line fields.
std::string SingleLine(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    out += (c == '\n' || c == '\r') ? ' ' : c;
  }
  return out;
}

}  // namespace

const char* EdlExportErrorToString(EdlExportError error) {
  switch (error) {
    case EdlExportError::kNone:
      return "NONE";
    case EdlExportError::kEmptyLog:
      return "EMPTY_LOG";
    case EdlExportError::kUnsupportedFrameRate:
      return "UNSUPPORTED_FRAME_RATE";
    case EdlExportError::kLogNotFinalized:
      return "LOG_NOT_FINALIZED";
    case EdlExportError::kWriteFailed:
      return "WRITE_FAILED";
    case EdlExportError::kTooManyEvents:
      return "TOO_MANY_EVENTS";
  }
  return "UNKNOWN";
}

bool EdlExporter::IsEdlFrameRate(const timecode::RationalFps& rate, bool drop_frame) {
  if (rate == timecode::FPS_2997) return true;
  if (drop_frame) return false;
  return rate == timecode::FPS_23976 || rate == timecode::FPS_24 ||
         rate == timecode::FPS_25 || rate == timecode::FPS_30;
}

std::string EdlExporter::ReelNameFor(const std::string& label) {
  std::string reel;
  for (char c : label) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc)) {
      reel += static_cast<char>(std::toupper(uc));
    } else if (c == ' ' || c == '_' || c == '-') {
      reel += '_';
    }
  }
  // Separators only count between name characters.
  const size_t first = reel.find_first_not_of('_');
  if (first == std::string::npos) return "AX";
  reel = reel.substr(first, kReelWidth);
  reel.erase(reel.find_last_not_of('_') + 1);
  return reel;
}

ExportResult EdlExporter::Export(const correlator::CutLog& log, const EdlExportConfig& config) {
  if (!log.IsFinalized()) {
    return ExportResult::Failure(EdlExportError::kLogNotFinalized,
                                 "session must be stopped before export");
  }
  if (!IsEdlFrameRate(log.rate(), log.drop_frame())) {
    std::ostringstream oss;
    oss << "rate " << log.rate().num << "/" << log.rate().den
        << (log.drop_frame() ? " drop-frame" : " non-drop-frame")
        << " has no EDL representation";
    return ExportResult::Failure(EdlExportError::kUnsupportedFrameRate, oss.str());
  }

  const std::vector<correlator::CutRecord> records = log.Records();
  if (records.empty() && config.reject_empty_export) {
    return ExportResult::Failure(EdlExportError::kEmptyLog, "session recorded no cuts");
  }
  size_t resolved_records = 0;
  for (const auto& record : records) {
    if (record.record_in.resolved() && record.record_out.has_value() &&
        record.record_out->resolved()) {
      ++resolved_records;
    }
  }
  if (resolved_records > kMaxEvents) {
    return ExportResult::Failure(
        EdlExportError::kTooManyEvents,
        std::to_string(resolved_records) + " events exceed the " +
            std::to_string(kMaxEvents) + "-event limit of a CMX3600 list");
  }

  std::ostringstream out;
  std::string title = SingleLine(config.title);
  if (title.size() > kTitleMax) title.resize(kTitleMax);
  out << "TITLE: " << title << "\n";
  out << "FCM: " << (log.drop_frame() ? "DROP FRAME" : "NON-DROP FRAME") << "\n";

  size_t event_number = 0;
  size_t unresolved = 0;
  for (const auto& record : records) {
    const std::string clip_name = SingleLine(record.source.label);
    if (!record.record_in.resolved() || !record.record_out.has_value() ||
        !record.record_out->resolved()) {
      ++unresolved;
      out << "\n* UNRESOLVED TIMECODE: " << clip_name
          << " (record " << record.sequence_index << ")\n";
      continue;
    }

    ++event_number;
    const std::string in = record.record_in.timecode->ToString();
    const std::string out_tc = record.record_out->timecode->ToString();
    const std::string reel = config.reel_mode == ReelNameMode::kAux
                                 ? std::string("AX")
                                 : ReelNameFor(record.source.label);

    out << "\n"
        << std::setw(3) << std::setfill('0') << event_number << std::setfill(' ') << "  "
        << PadRight(reel, kReelWidth) << " "
        << PadRight(config.track_type, kTrackWidth) << " "
        << "C       " << " "
        << in << " " << out_tc << " " << in << " " << out_tc << "\n";
    out << "* FROM CLIP NAME: " << clip_name << "\n";
  }

  return ExportResult::Success(out.str(), event_number, unresolved);
}

ExportResult EdlExporter::ExportToFile(const correlator::CutLog& log,
                                       const EdlExportConfig& config,
                                       const std::string& path) {
  ExportResult result = Export(log, config);
  if (!result.ok) {
    util::Logger::Warn(std::string("[EdlExporter] Export failed: ") +
                       EdlExportErrorToString(result.error) + " " + result.detail);
    return result;
  }

  const std::string tmp_path = path + ".tmp";
  {
    std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      return ExportResult::Failure(EdlExportError::kWriteFailed, "cannot open " + tmp_path);
    }
    file.write(result.bytes.data(), static_cast<std::streamsize>(result.bytes.size()));
    file.flush();
    if (!file) {
      std::remove(tmp_path.c_str());
      return ExportResult::Failure(EdlExportError::kWriteFailed, "write failed " + tmp_path);
    }
  }
  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    std::remove(tmp_path.c_str());
    return ExportResult::Failure(EdlExportError::kWriteFailed, "cannot rename to " + path);
  }

  util::Logger::Info("[EdlExporter] Wrote " + std::to_string(result.events_written) +
                     " events to " + path);
  return result;
}

}  // namespace cutlog::edl
