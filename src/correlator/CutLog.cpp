// Repository: CutLog
// Component: Cut Log
// Purpose: Append-only, continuity-checked sequence of cut records for one session.
// Copyright (c) 2026 CutLog

#include "cutlog/correlator/CutLog.h"

#include "cutlog/util/Logger.hpp"

namespace cutlog::correlator {

std::optional<int64_t> CutRecord::DurationFrames() const {
  if (!record_out.has_value() || !record_in.resolved() || !record_out->resolved()) {
    return std::nullopt;
  }
  const timecode::Timecode& in = *record_in.timecode;
  const int64_t per_day = timecode::Timecode::FramesPerDay(in.rate(), in.drop_frame());
  int64_t frames = record_out->timecode->FramesSince(in) % per_day;
  if (frames < 0) frames += per_day;
  return frames;
}

CutLog::CutLog(const timecode::RationalFps& rate, bool drop_frame)
    : rate_(rate), drop_frame_(drop_frame) {}

void CutLog::FailLocked(const std::string& what) const {
  const std::string line = "[CutLog] INVARIANT VIOLATION: " + what;
  util::Logger::Error(line);
  throw InvariantViolation(line);
}

size_t CutLog::BoundaryCountLocked() const {
  if (records_.empty()) return 0;
  return records_.back().IsOpen() ? records_.size() : records_.size() + 1;
}

void CutLog::Append(CutRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (finalized_) {
    FailLocked("append after finalize");
  }
  if (!records_.empty() && records_.back().IsOpen()) {
    FailLocked("append while record " + std::to_string(records_.back().sequence_index) +
               " is still open");
  }
  if (record.sequence_index != records_.size()) {
    FailLocked("sequence gap (expected " + std::to_string(records_.size()) + ", got " +
               std::to_string(record.sequence_index) + ")");
  }
  if (record.record_out.has_value()) {
    FailLocked("appended record must be open");
  }
  if (!records_.empty() && *records_.back().record_out != record.record_in) {
    FailLocked("record_in of " + std::to_string(record.sequence_index) +
               " does not equal record_out of its predecessor");
  }
  records_.push_back(std::move(record));
}

void CutLog::CloseOpen(const CutBoundary& record_out) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (finalized_) {
    FailLocked("close after finalize");
  }
  if (records_.empty() || !records_.back().IsOpen()) {
    FailLocked("close with no open record");
  }
  CutRecord& open = records_.back();
  if (record_out.observed_us < open.record_in.observed_us) {
    FailLocked("record_out observed before record_in on record " +
               std::to_string(open.sequence_index));
  }
  open.record_out = record_out;
}

void CutLog::ResolveBoundary(size_t boundary_index, const timecode::Timecode& tc) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (finalized_) {
    FailLocked("resolve after finalize");
  }
  if (boundary_index >= BoundaryCountLocked()) {
    FailLocked("boundary " + std::to_string(boundary_index) + " does not exist");
  }

  CutBoundary* in = boundary_index < records_.size() ? &records_[boundary_index].record_in
                                                     : nullptr;
  CutBoundary* out = boundary_index > 0 ? &*records_[boundary_index - 1].record_out : nullptr;

  const CutBoundary& current = in != nullptr ? *in : *out;
  if (current.resolved()) {
    if (*current.timecode != tc) {
      FailLocked("boundary " + std::to_string(boundary_index) + " already resolved to " +
                 current.timecode->ToString());
    }
    return;
  }
  if (in != nullptr) in->timecode = tc;
  if (out != nullptr) out->timecode = tc;
}

void CutLog::Finalize() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (finalized_) return;
  if (!records_.empty() && records_.back().IsOpen()) {
    FailLocked("finalize with record " + std::to_string(records_.back().sequence_index) +
               " still open");
  }
  finalized_ = true;
}

bool CutLog::IsFinalized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return finalized_;
}

bool CutLog::HasOpenRecord() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !records_.empty() && records_.back().IsOpen();
}

size_t CutLog::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

std::vector<CutRecord> CutLog::Records() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

std::optional<CutRecord> CutLog::OpenRecord() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (records_.empty() || !records_.back().IsOpen()) {
    return std::nullopt;
  }
  return records_.back();
}

size_t CutLog::BoundaryCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return BoundaryCountLocked();
}

std::optional<CutBoundary> CutLog::BoundaryAt(size_t boundary_index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (boundary_index >= BoundaryCountLocked()) {
    return std::nullopt;
  }
  if (boundary_index < records_.size()) {
    return records_[boundary_index].record_in;
  }
  return records_.back().record_out;
}

size_t CutLog::UnresolvedBoundaryCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  for (const auto& r : records_) {
    if (!r.record_in.resolved()) ++count;
  }
  if (!records_.empty() && !records_.back().IsOpen() && !records_.back().record_out->resolved()) {
    ++count;
  }
  return count;
}

}  // namespace cutlog::correlator
