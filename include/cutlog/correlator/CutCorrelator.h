// Repository: CutLog
// Component: Cut Correlator
// Purpose: Pairs switcher source changes with compensated recorder timecode.
// Copyright (c) 2026 CutLog

#ifndef CUTLOG_CORRELATOR_CUT_CORRELATOR_H_
#define CUTLOG_CORRELATOR_CUT_CORRELATOR_H_

#include <cstdint>
#include <memory>
#include <vector>

#include "cutlog/correlator/CutLog.h"
#include "cutlog/correlator/FrameOffsetCompensator.h"
#include "cutlog/devices/DeviceEvents.hpp"
#include "cutlog/timing/TimecodeTracker.h"

namespace cutlog::correlator {

// CutCorrelator state machine.
//
//   kIdle --Start()--> kArmed --OnSourceChanged()--> kRecording
//   kRecording --Start()--> kArmed (previous log abandoned)
//   kArmed / kRecording --Stop()--> kIdle (log finalized)
//
// A cut closes the open record and opens the next one with the same
// CutBoundary, so record_out/record_in continuity holds by construction and
// the tracker is queried once per cut.
//
// Boundaries whose timecode the tracker cannot supply yet are kept pending
// with their raw observed instant and resolved on the next source event or at
// Stop(). Anything still pending after Stop() stays unresolved in the log.
//
// Not thread-safe: driven by the session sequencer only.
class CutCorrelator {
 public:
  enum class State {
    kIdle = 0,
    kArmed = 1,
    kRecording = 2,
  };

  enum class SourceChangeOutcome {
    // First record of the session opened.
    kOpened,
    // Open record closed, next one opened.
    kCut,
    // Same source as the open record; nothing changed.
    kDuplicateSuppressed,
    // Observed before the open record began; discarded.
    kLateDiscarded,
    // No session.
    kIgnoredIdle,
  };

  struct StopOutcome {
    bool was_active = false;
    size_t records = 0;
    size_t unresolved_boundaries = 0;
  };

  CutCorrelator(const timing::TimecodeTracker& tracker, FrameOffsetCompensator compensator);

  CutCorrelator(const CutCorrelator&) = delete;
  CutCorrelator& operator=(const CutCorrelator&) = delete;

  void Start();
  SourceChangeOutcome OnSourceChanged(const devices::SourceId& source, int64_t observed_us);
  StopOutcome Stop(int64_t stop_us);

  State state() const { return state_; }

  // Current session's log, or the last finalized one after Stop().
  // nullptr before the first Start().
  std::shared_ptr<const CutLog> log() const { return log_; }

  size_t PendingBoundaryCount() const { return pending_boundaries_.size(); }
  uint64_t deferred_boundaries_total() const { return deferred_boundaries_total_; }

 private:
  // Resolves as many pending boundaries as the tracker allows, oldest first.
  void ResolvePending();

  // Builds the boundary for observed_us, resolved when the tracker can.
  CutBoundary MakeBoundary(int64_t observed_us, bool* deferred) const;

  void NoteDeferred(size_t boundary_index, int64_t observed_us);

  const timing::TimecodeTracker& tracker_;
  const FrameOffsetCompensator compensator_;

  State state_ = State::kIdle;
  std::shared_ptr<CutLog> log_;
  std::vector<size_t> pending_boundaries_;
  uint64_t deferred_boundaries_total_ = 0;
};

const char* CorrelatorStateToString(CutCorrelator::State state);
const char* SourceChangeOutcomeToString(CutCorrelator::SourceChangeOutcome outcome);

}  // namespace cutlog::correlator

#endif  // CUTLOG_CORRELATOR_CUT_CORRELATOR_H_
