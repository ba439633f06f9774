// Repository: CutLog
// Component: Cut Correlator
// Purpose: Pairs switcher source changes with compensated recorder timecode.
// Copyright (c) 2026 CutLog

#include "cutlog/correlator/CutCorrelator.h"

#include <algorithm>
#include <sstream>

#include "cutlog/util/Logger.hpp"

namespace cutlog::correlator {

const char* CorrelatorStateToString(CutCorrelator::State state) {
  switch (state) {
    case CutCorrelator::State::kIdle:
      return "IDLE";
    case CutCorrelator::State::kArmed:
      return "ARMED";
    case CutCorrelator::State::kRecording:
      return "RECORDING";
  }
  return "UNKNOWN";
}

const char* SourceChangeOutcomeToString(CutCorrelator::SourceChangeOutcome outcome) {
  switch (outcome) {
    case CutCorrelator::SourceChangeOutcome::kOpened:
      return "OPENED";
    case CutCorrelator::SourceChangeOutcome::kCut:
      return "CUT";
    case CutCorrelator::SourceChangeOutcome::kDuplicateSuppressed:
      return "DUPLICATE_SUPPRESSED";
    case CutCorrelator::SourceChangeOutcome::kLateDiscarded:
      return "LATE_DISCARDED";
    case CutCorrelator::SourceChangeOutcome::kIgnoredIdle:
      return "IGNORED_IDLE";
  }
  return "UNKNOWN";
}

namespace {

std::string BoundaryText(const CutBoundary& b) {
  return b.resolved() ? b.timecode->ToString() : std::string("<pending>");
}

}  // namespace

CutCorrelator::CutCorrelator(const timing::TimecodeTracker& tracker,
                             FrameOffsetCompensator compensator)
    : tracker_(tracker), compensator_(compensator) {}

void CutCorrelator::Start() {
  if (state_ == State::kRecording || state_ == State::kArmed) {
    util::Logger::Warn(std::string("[CutCorrelator] Start() while ") +
                       CorrelatorStateToString(state_) +
                       "; previous log abandoned without finalize");
  }
  const auto& cfg = tracker_.config();
  log_ = std::make_shared<CutLog>(cfg.rate, cfg.drop_frame);
  pending_boundaries_.clear();
  deferred_boundaries_total_ = 0;
  state_ = State::kArmed;
  util::Logger::Info("[CutCorrelator] ARMED offset_frames=" +
                     std::to_string(compensator_.offset_frames()));
}

CutBoundary CutCorrelator::MakeBoundary(int64_t observed_us, bool* deferred) const {
  CutBoundary boundary;
  boundary.observed_us = observed_us;
  const timing::EstimateResult estimate = tracker_.EstimateAt(observed_us);
  if (estimate.ok) {
    boundary.timecode = compensator_.Compensate(*estimate.timecode);
    *deferred = false;
  } else {
    *deferred = true;
    util::Logger::Debug(std::string("[CutCorrelator] estimate unavailable: ") +
                        timing::TimecodeEstimateErrorToString(estimate.error) + " " +
                        estimate.detail);
  }
  return boundary;
}

void CutCorrelator::NoteDeferred(size_t boundary_index, int64_t observed_us) {
  pending_boundaries_.push_back(boundary_index);
  ++deferred_boundaries_total_;
  util::Logger::Warn("[CutCorrelator] Timecode deferred for boundary " +
                     std::to_string(boundary_index) +
                     " observed_us=" + std::to_string(observed_us));
}

void CutCorrelator::ResolvePending() {
  if (pending_boundaries_.empty() || !log_) return;

  std::vector<size_t> still_pending;
  for (size_t index : pending_boundaries_) {
    const auto boundary = log_->BoundaryAt(index);
    if (!boundary.has_value() || boundary->resolved()) {
      continue;
    }
    const timing::EstimateResult estimate = tracker_.EstimateAt(boundary->observed_us);
    if (!estimate.ok) {
      still_pending.push_back(index);
      continue;
    }
    const timecode::Timecode tc = compensator_.Compensate(*estimate.timecode);
    log_->ResolveBoundary(index, tc);
    util::Logger::Info("[CutCorrelator] Resolved deferred boundary " + std::to_string(index) +
                       " -> " + tc.ToString());
  }
  pending_boundaries_.swap(still_pending);
}

CutCorrelator::SourceChangeOutcome CutCorrelator::OnSourceChanged(
    const devices::SourceId& source, int64_t observed_us) {
  if (state_ == State::kIdle) {
    return SourceChangeOutcome::kIgnoredIdle;
  }

  ResolvePending();

  if (state_ == State::kArmed) {
    bool deferred = false;
    CutRecord first;
    first.sequence_index = 0;
    first.source = source;
    first.record_in = MakeBoundary(observed_us, &deferred);
    log_->Append(first);
    if (deferred) {
      NoteDeferred(0, observed_us);
    }
    state_ = State::kRecording;
    util::Logger::Info("[CutCorrelator] OPEN #0 source=" + source.id + " (" + source.label +
                       ") in=" + BoundaryText(first.record_in));
    return SourceChangeOutcome::kOpened;
  }

  const std::optional<CutRecord> open = log_->OpenRecord();
  if (!open.has_value()) {
    const std::string line = "[CutCorrelator] INVARIANT VIOLATION: RECORDING without an open record";
    util::Logger::Error(line);
    throw InvariantViolation(line);
  }

  if (open->source == source) {
    util::Logger::Debug("[CutCorrelator] Duplicate source change suppressed: " + source.id);
    return SourceChangeOutcome::kDuplicateSuppressed;
  }

  if (observed_us < open->record_in.observed_us) {
    std::ostringstream oss;
    oss << "[CutCorrelator] Late source change discarded: source=" << source.id
        << " observed_us=" << observed_us
        << " precedes open record #" << open->sequence_index
        << " observed_us=" << open->record_in.observed_us;
    util::Logger::Warn(oss.str());
    return SourceChangeOutcome::kLateDiscarded;
  }

  bool deferred = false;
  const CutBoundary cut = MakeBoundary(observed_us, &deferred);
  const uint64_t next_index = open->sequence_index + 1;

  log_->CloseOpen(cut);
  CutRecord next;
  next.sequence_index = next_index;
  next.source = source;
  next.record_in = cut;
  log_->Append(next);
  if (deferred) {
    NoteDeferred(static_cast<size_t>(next_index), observed_us);
  }

  util::Logger::Info("[CutCorrelator] CUT #" + std::to_string(next_index) + " " +
                     open->source.id + " -> " + source.id + " (" + source.label +
                     ") at " + BoundaryText(cut));
  return SourceChangeOutcome::kCut;
}

CutCorrelator::StopOutcome CutCorrelator::Stop(int64_t stop_us) {
  StopOutcome outcome;
  if (state_ == State::kIdle) {
    return outcome;
  }
  outcome.was_active = true;

  ResolvePending();

  if (state_ == State::kRecording) {
    const std::optional<CutRecord> open = log_->OpenRecord();
    if (open.has_value()) {
      const int64_t out_us = std::max(stop_us, open->record_in.observed_us);
      bool deferred = false;
      const CutBoundary out = MakeBoundary(out_us, &deferred);
      log_->CloseOpen(out);
      if (deferred) {
        NoteDeferred(log_->BoundaryCount() - 1, out_us);
      }
    }
  }

  for (size_t index : pending_boundaries_) {
    util::Logger::Warn("[CutCorrelator] UNRESOLVED boundary " + std::to_string(index) +
                       " at stop; timecode left unresolved");
  }

  log_->Finalize();
  outcome.records = log_->Size();
  outcome.unresolved_boundaries = log_->UnresolvedBoundaryCount();
  pending_boundaries_.clear();
  state_ = State::kIdle;

  util::Logger::Info("[CutCorrelator] STOPPED records=" + std::to_string(outcome.records) +
                     " unresolved=" + std::to_string(outcome.unresolved_boundaries));
  return outcome;
}

}  // namespace cutlog::correlator
