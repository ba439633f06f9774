// Repository: CutLog
// Component: EDL Exporter
// Purpose: Serializes a finalized Cut Log as a CMX3600-style edit decision list.
// Copyright (c) 2026 CutLog

#ifndef CUTLOG_EDL_EDL_EXPORTER_H_
#define CUTLOG_EDL_EDL_EXPORTER_H_

#include <cstddef>
#include <string>
#include <utility>

#include "cutlog/correlator/CutLog.h"
#include "cutlog/timecode/RationalFps.hpp"

namespace cutlog::edl {

enum class EdlExportError {
  kNone = 0,
  // Log has no records and the config rejects empty sessions.
  kEmptyLog,
  // Session rate has no EDL representation.
  kUnsupportedFrameRate,
  // Export requires a finalized (stopped) session.
  kLogNotFinalized,
  // ExportToFile could not write the destination.
  kWriteFailed,
  // More resolved records than the 999 events a CMX3600 list can number.
  kTooManyEvents,
};

const char* EdlExportErrorToString(EdlExportError error);

enum class ReelNameMode {
  // Reel column derived from the source label (CAM_1, VT2, ...).
  kFromSourceLabel,
  // Reel column fixed to "AX"; the label only appears as the clip name.
  kAux,
};

struct EdlExportConfig {
  std::string title = "Program Output";
  bool reject_empty_export = false;
  std::string track_type = "V";
  ReelNameMode reel_mode = ReelNameMode::kFromSourceLabel;
};

struct ExportResult {
  bool ok;
  EdlExportError error;
  std::string bytes;
  size_t events_written;
  // Records left out because a boundary never got a timecode.
  size_t unresolved_records;
  std::string detail;

  static ExportResult Success(std::string bytes, size_t events, size_t unresolved) {
    return {true, EdlExportError::kNone, std::move(bytes), events, unresolved, ""};
  }

  static ExportResult Failure(EdlExportError err, const std::string& detail = "") {
    return {false, err, "", 0, 0, detail};
  }
};

// Output layout:
//
//   TITLE: <title>
//   FCM: DROP FRAME | NON-DROP FRAME
//
//   001  CAM_1    V     C        01:00:00:00 01:00:10:00 01:00:00:00 01:00:10:00
//   * FROM CLIP NAME: Cam 1
//
// One event per record. Source and record columns carry the same
// recordIn/recordOut pair. Records with an unresolved boundary are listed as
// "* UNRESOLVED TIMECODE" comments and take no event number. A log with more
// than 999 numbered events is refused with kTooManyEvents.
//
// Export is a pure function of (log, config): same input, same bytes.
class EdlExporter {
 public:
  static ExportResult Export(const correlator::CutLog& log, const EdlExportConfig& config);

  // Export() then write to `path` through a temporary file and rename.
  static ExportResult ExportToFile(const correlator::CutLog& log,
                                   const EdlExportConfig& config,
                                   const std::string& path);

  // 23.976, 24, 25, 29.97 (drop or non-drop) and 30 non-drop.
  static bool IsEdlFrameRate(const timecode::RationalFps& rate, bool drop_frame);

  // Upper-case alphanumerics, inner separators as '_', at most 8 characters,
  // "AX" when no name character remains.
  static std::string ReelNameFor(const std::string& label);
};

}  // namespace cutlog::edl

#endif  // CUTLOG_EDL_EDL_EXPORTER_H_
