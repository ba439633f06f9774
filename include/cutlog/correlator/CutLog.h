// Repository: CutLog
// Component: Cut Log
// Purpose: Append-only, continuity-checked sequence of cut records for one session.
// Copyright (c) 2026 CutLog

#ifndef CUTLOG_CORRELATOR_CUT_LOG_H_
#define CUTLOG_CORRELATOR_CUT_LOG_H_

#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "cutlog/devices/DeviceEvents.hpp"
#include "cutlog/timecode/RationalFps.hpp"
#include "cutlog/timecode/Timecode.hpp"

namespace cutlog::correlator {

// Thrown when a Cut Log mutation would break ordering or continuity.
// A programming error: never expected in correct operation, never retried.
class InvariantViolation : public std::logic_error {
 public:
  explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

// The instant a record became (or stopped being) active. The timecode stays
// unresolved until the tracker can answer for observed_us.
struct CutBoundary {
  int64_t observed_us = 0;
  std::optional<timecode::Timecode> timecode;

  bool resolved() const { return timecode.has_value(); }

  bool operator==(const CutBoundary& other) const {
    return observed_us == other.observed_us && timecode == other.timecode;
  }
  bool operator!=(const CutBoundary& other) const { return !(*this == other); }
};

struct CutRecord {
  uint64_t sequence_index = 0;
  devices::SourceId source;
  CutBoundary record_in;
  // nullopt while this is the open (current) record.
  std::optional<CutBoundary> record_out;

  bool IsOpen() const { return !record_out.has_value(); }

  // record_out - record_in, counted forward through midnight (a record is
  // shorter than a day). nullopt while open or unresolved.
  std::optional<int64_t> DurationFrames() const;
};

// CutLog enforces, on every mutation:
//   - sequence_index runs 0, 1, 2, ... without gaps
//   - at most one open record, always the last
//   - record[i].record_out == record[i + 1].record_in
//   - no mutation after Finalize()
// Violations are logged and thrown as InvariantViolation.
//
// Boundary k is record[k].record_in, which for k > 0 is the same instant as
// record[k - 1].record_out; boundary Size() is the last record's record_out.
//
// Thread-safety: mutations come from the session sequencer; Records() and
// the other queries may be called by display consumers at any time.
class CutLog {
 public:
  CutLog(const timecode::RationalFps& rate, bool drop_frame);

  CutLog(const CutLog&) = delete;
  CutLog& operator=(const CutLog&) = delete;

  void Append(CutRecord record);
  void CloseOpen(const CutBoundary& record_out);

  // Sets the timecode of boundary k on both records that share it.
  void ResolveBoundary(size_t boundary_index, const timecode::Timecode& tc);

  // Requires no open record.
  void Finalize();

  bool IsFinalized() const;
  bool HasOpenRecord() const;
  size_t Size() const;
  bool Empty() const { return Size() == 0; }

  // Read-only snapshot.
  std::vector<CutRecord> Records() const;

  std::optional<CutRecord> OpenRecord() const;

  size_t BoundaryCount() const;
  std::optional<CutBoundary> BoundaryAt(size_t boundary_index) const;
  size_t UnresolvedBoundaryCount() const;

  const timecode::RationalFps& rate() const { return rate_; }
  bool drop_frame() const { return drop_frame_; }

 private:
  [[noreturn]] void FailLocked(const std::string& what) const;
  size_t BoundaryCountLocked() const;

  const timecode::RationalFps rate_;
  const bool drop_frame_;

  mutable std::mutex mutex_;
  std::vector<CutRecord> records_;
  bool finalized_ = false;
};

}  // namespace cutlog::correlator

#endif  // CUTLOG_CORRELATOR_CUT_LOG_H_
