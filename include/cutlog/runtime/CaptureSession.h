// Repository: CutLog
// Component: Capture Session
// Purpose: Single-writer sequencing point for one switcher/recorder session.
// Copyright (c) 2026 CutLog

#ifndef CUTLOG_RUNTIME_CAPTURE_SESSION_H_
#define CUTLOG_RUNTIME_CAPTURE_SESSION_H_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "cutlog/correlator/CutCorrelator.h"
#include "cutlog/correlator/CutLog.h"
#include "cutlog/devices/DeviceEvents.hpp"
#include "cutlog/edl/EdlExporter.h"
#include "cutlog/runtime/CaptureConfig.h"
#include "cutlog/runtime/EventChannel.hpp"
#include "cutlog/telemetry/SessionMetrics.hpp"
#include "cutlog/time/ITimeSource.hpp"
#include "cutlog/timing/TimecodeTracker.h"

namespace cutlog::runtime {

class CaptureSession;

enum class SessionStartError {
  kNone = 0,
  kInvalidConfig,
  kInvalidOffset,
};

const char* SessionStartErrorToString(SessionStartError error);

struct SessionStartResult {
  bool ok;
  SessionStartError error;
  std::unique_ptr<CaptureSession> session;
  std::string detail;
};

// CaptureSession is the explicit session object: it owns the tracker, the
// correlator (and through it the Cut Log), one bounded channel per device
// stream and the sequencer thread that applies both streams.
//
// Producers (switcher / recorder collaborator threads) call OnSourceChanged
// and OnTimecodeTick. They never block: the event is queued or rejected.
//
// The sequencer is the only writer of tracker and log state. Each wake-up it
// drains both channels, merges them by observed_us (a tick sorts before a
// source change at the same instant) and applies everything older than the
// reorder window.
//
// Stop() closes both channels, lets the sequencer apply everything already
// queued, joins it, closes the open record at the stop instant and finalizes
// the log. Events posted after Stop(), or observed after the stop instant,
// are discarded and counted in dropped_after_stop.
class CaptureSession : public devices::IDeviceEventSink {
 public:
  static SessionStartResult Start(const CaptureConfig& config,
                                  std::shared_ptr<ITimeSource> time_source,
                                  std::string session_id);

  ~CaptureSession() override;

  CaptureSession(const CaptureSession&) = delete;
  CaptureSession& operator=(const CaptureSession&) = delete;

  // IDeviceEventSink. Thread-safe, non-blocking.
  bool OnSourceChanged(const devices::SourceChanged& event) override;
  bool OnTimecodeTick(const devices::TimecodeTick& tick) override;

  struct StopResult {
    // False if the session had already been stopped.
    bool stopped_now;
    size_t records;
    size_t unresolved_boundaries;
    std::shared_ptr<const correlator::CutLog> log;
  };

  // Stop at the time source's current instant.
  StopResult Stop();
  StopResult Stop(int64_t stop_us);

  // Read-only consumers (live display). Safe from any thread.
  std::vector<correlator::CutRecord> Records() const;
  timing::EstimateResult EstimateAt(int64_t instant_us) const;
  std::shared_ptr<const correlator::CutLog> log() const;
  telemetry::SessionMetrics Metrics() const;
  bool IsActive() const;

  // Finalized log only.
  edl::ExportResult Export() const;

  const std::string& id() const { return session_id_; }
  const CaptureConfig& config() const { return config_; }

 private:
  CaptureSession(const CaptureConfig& config,
                 std::shared_ptr<ITimeSource> time_source,
                 std::string session_id,
                 correlator::FrameOffsetCompensator compensator);

  // One merged entry: exactly one of tick / source is set.
  struct Sequenced {
    int64_t observed_us;
    uint64_t arrival;
    std::optional<devices::TimecodeTick> tick;
    std::optional<devices::SourceChanged> source;
  };

  void Wake();
  void SequencerLoop();
  void DrainChannels(std::vector<Sequenced>* staged);
  void ApplyUpTo(std::vector<Sequenced>* staged, int64_t cutoff_us);
  void Apply(const Sequenced& item);

  const CaptureConfig config_;
  const std::shared_ptr<ITimeSource> time_source_;
  const std::string session_id_;

  timing::TimecodeTracker tracker_;
  correlator::CutCorrelator correlator_;

  EventChannel<devices::TimecodeTick> tick_channel_;
  EventChannel<devices::SourceChanged> source_channel_;
  // Sequencer-only: drain order, the tie-break after observed_us and kind.
  uint64_t drain_counter_ = 0;

  // Sequencer wake-up.
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  bool wake_pending_ = false;
  bool stop_requested_ = false;
  // Events observed after this instant are dropped; set by Stop().
  std::atomic<int64_t> stop_us_{INT64_MAX};
  std::thread sequencer_;
  // Set by the sequencer if an invariant violation stopped it; rethrown by Stop().
  std::exception_ptr fatal_error_;
  std::atomic<bool> active_{true};

  // Serializes Stop() callers.
  std::mutex stop_mutex_;
  bool stopped_ = false;
  StopResult last_stop_{false, 0, 0, nullptr};

  mutable std::mutex metrics_mutex_;
  telemetry::SessionMetrics metrics_;
};

}  // namespace cutlog::runtime

#endif  // CUTLOG_RUNTIME_CAPTURE_SESSION_H_
