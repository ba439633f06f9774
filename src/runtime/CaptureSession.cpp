// Repository: CutLog
// Component: Capture Session
// Purpose: Single-writer sequencing point for one switcher/recorder session.
// Copyright (c) 2026 CutLog

#include "cutlog/runtime/CaptureSession.h"

#include <algorithm>
#include <chrono>
#include <sstream>

#include "cutlog/util/Logger.hpp"

namespace cutlog::runtime {

using correlator::CutCorrelator;

const char* SessionStartErrorToString(SessionStartError error) {
  switch (error) {
    case SessionStartError::kNone:
      return "NONE";
    case SessionStartError::kInvalidConfig:
      return "INVALID_CONFIG";
    case SessionStartError::kInvalidOffset:
      return "INVALID_OFFSET";
  }
  return "UNKNOWN";
}

SessionStartResult CaptureSession::Start(const CaptureConfig& config,
                                         std::shared_ptr<ITimeSource> time_source,
                                         std::string session_id) {
  const auto compensator = correlator::FrameOffsetCompensator::Create(
      config.frame_offset, config.frame_rate, config.drop_frame);
  const auto validation = config.Validate();
  if (!validation.valid) {
    std::string detail;
    for (const auto& e : validation.errors) {
      if (!detail.empty()) detail += "; ";
      detail += e;
    }
    const bool offset_only = timecode::Timecode::IsSupportedFormat(config.frame_rate,
                                                                   config.drop_frame) &&
                             !compensator.ok && validation.errors.size() == 1;
    util::Logger::Warn("[CaptureSession] Start rejected: " + detail);
    return {false,
            offset_only ? SessionStartError::kInvalidOffset : SessionStartError::kInvalidConfig,
            nullptr, detail};
  }
  if (!time_source) {
    return {false, SessionStartError::kInvalidConfig, nullptr, "time source is required"};
  }

  std::unique_ptr<CaptureSession> session(new CaptureSession(
      config, std::move(time_source), std::move(session_id), *compensator.compensator));
  return {true, SessionStartError::kNone, std::move(session), ""};
}

CaptureSession::CaptureSession(const CaptureConfig& config,
                               std::shared_ptr<ITimeSource> time_source,
                               std::string session_id,
                               correlator::FrameOffsetCompensator compensator)
    : config_(config),
      time_source_(std::move(time_source)),
      session_id_(std::move(session_id)),
      tracker_(config.ToTrackerConfig()),
      correlator_(tracker_, compensator),
      tick_channel_(config.channel_capacity),
      source_channel_(config.channel_capacity) {
  metrics_.session_id = session_id_;
  metrics_.session_active = true;
  correlator_.Start();

  std::ostringstream oss;
  oss << "[CaptureSession] START id=" << session_id_
      << " fps=" << FrameRateToString(config_.frame_rate)
      << (config_.drop_frame ? " DF" : " NDF")
      << " offset=" << config_.frame_offset
      << " stale_ms=" << config_.staleness_threshold_ms;
  util::Logger::Info(oss.str());

  sequencer_ = std::thread(&CaptureSession::SequencerLoop, this);
}

CaptureSession::~CaptureSession() {
  if (active_.load(std::memory_order_acquire)) {
    try {
      Stop();
    } catch (const std::exception& e) {
      util::Logger::Error(std::string("[CaptureSession] Stop during destruction failed: ") +
                          e.what());
    }
  }
  if (sequencer_.joinable()) {
    sequencer_.join();
  }
}

void CaptureSession::Wake() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    wake_pending_ = true;
  }
  wake_cv_.notify_one();
}

bool CaptureSession::OnSourceChanged(const devices::SourceChanged& event) {
  {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    ++metrics_.source_events_received;
  }
  switch (source_channel_.TryPush(event)) {
    case EventChannel<devices::SourceChanged>::PushResult::kAccepted:
      Wake();
      return true;
    case EventChannel<devices::SourceChanged>::PushResult::kFull: {
      std::lock_guard<std::mutex> lock(metrics_mutex_);
      ++metrics_.channel_overflow_total;
      util::Logger::Warn("[CaptureSession] Switcher channel full; dropped source change " +
                         event.source.id);
      return false;
    }
    case EventChannel<devices::SourceChanged>::PushResult::kClosed: {
      std::lock_guard<std::mutex> lock(metrics_mutex_);
      ++metrics_.dropped_after_stop;
      return false;
    }
  }
  return false;
}

bool CaptureSession::OnTimecodeTick(const devices::TimecodeTick& tick) {
  {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    ++metrics_.ticks_received;
  }
  switch (tick_channel_.TryPush(tick)) {
    case EventChannel<devices::TimecodeTick>::PushResult::kAccepted:
      Wake();
      return true;
    case EventChannel<devices::TimecodeTick>::PushResult::kFull: {
      std::lock_guard<std::mutex> lock(metrics_mutex_);
      ++metrics_.channel_overflow_total;
      util::Logger::Debug("[CaptureSession] Recorder channel full; dropped tick");
      return false;
    }
    case EventChannel<devices::TimecodeTick>::PushResult::kClosed: {
      std::lock_guard<std::mutex> lock(metrics_mutex_);
      ++metrics_.dropped_after_stop;
      return false;
    }
  }
  return false;
}

void CaptureSession::SequencerLoop() {
  std::vector<Sequenced> staged;
  const int64_t window_us = config_.reorder_window_ms * 1'000;

  while (true) {
    bool stopping = false;
    {
      std::unique_lock<std::mutex> lock(wake_mutex_);
      auto ready = [this] { return wake_pending_ || stop_requested_; };
      if (window_us > 0 && !staged.empty()) {
        wake_cv_.wait_for(lock, std::chrono::milliseconds(config_.reorder_window_ms), ready);
      } else {
        wake_cv_.wait(lock, ready);
      }
      wake_pending_ = false;
      stopping = stop_requested_;
    }

    DrainChannels(&staged);

    try {
      if (stopping) {
        ApplyUpTo(&staged, INT64_MAX);
        return;
      }
      const int64_t cutoff = window_us > 0 ? time_source_->NowUs() - window_us : INT64_MAX;
      ApplyUpTo(&staged, cutoff);
    } catch (const correlator::InvariantViolation&) {
      fatal_error_ = std::current_exception();
      tick_channel_.Close();
      source_channel_.Close();
      util::Logger::Error("[CaptureSession] Sequencer halted by invariant violation; id=" +
                          session_id_);
      return;
    }
  }
}

void CaptureSession::DrainChannels(std::vector<Sequenced>* staged) {
  std::vector<devices::TimecodeTick> ticks;
  std::vector<devices::SourceChanged> sources;
  tick_channel_.DrainTo(&ticks);
  source_channel_.DrainTo(&sources);

  for (auto& tick : ticks) {
    Sequenced s{tick.observed_us, drain_counter_++, std::move(tick), std::nullopt};
    staged->push_back(std::move(s));
  }
  for (auto& src : sources) {
    Sequenced s{src.observed_us, drain_counter_++, std::nullopt, std::move(src)};
    staged->push_back(std::move(s));
  }
}

void CaptureSession::ApplyUpTo(std::vector<Sequenced>* staged, int64_t cutoff_us) {
  if (staged->empty()) return;

  // Observed order; at the same instant a tick goes first so the cut sees it.
  std::stable_sort(staged->begin(), staged->end(), [](const Sequenced& a, const Sequenced& b) {
    if (a.observed_us != b.observed_us) return a.observed_us < b.observed_us;
    const int ka = a.tick.has_value() ? 0 : 1;
    const int kb = b.tick.has_value() ? 0 : 1;
    if (ka != kb) return ka < kb;
    return a.arrival < b.arrival;
  });

  auto first_held = std::find_if(staged->begin(), staged->end(), [cutoff_us](const Sequenced& s) {
    return s.observed_us > cutoff_us;
  });
  for (auto it = staged->begin(); it != first_held; ++it) {
    Apply(*it);
  }
  staged->erase(staged->begin(), first_held);
}

void CaptureSession::Apply(const Sequenced& item) {
  if (item.observed_us > stop_us_.load(std::memory_order_acquire)) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    ++metrics_.dropped_after_stop;
    return;
  }

  if (item.tick.has_value()) {
    const auto& tick = *item.tick;
    const bool accepted = tracker_.RecordTick(tick.timecode, tick.transport_state, tick.observed_us);
    const auto snap = tracker_.GetSnapshot();
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    if (accepted) {
      ++metrics_.ticks_applied;
    } else {
      ++metrics_.ticks_rejected;
    }
    metrics_.discontinuities = snap.discontinuities;
    return;
  }

  const auto& change = *item.source;
  const CutCorrelator::SourceChangeOutcome outcome =
      correlator_.OnSourceChanged(change.source, change.observed_us);

  std::lock_guard<std::mutex> lock(metrics_mutex_);
  ++metrics_.source_events_applied;
  switch (outcome) {
    case CutCorrelator::SourceChangeOutcome::kOpened:
    case CutCorrelator::SourceChangeOutcome::kCut:
      ++metrics_.cuts_recorded;
      break;
    case CutCorrelator::SourceChangeOutcome::kDuplicateSuppressed:
      ++metrics_.duplicates_suppressed;
      break;
    case CutCorrelator::SourceChangeOutcome::kLateDiscarded:
      ++metrics_.late_source_events;
      break;
    case CutCorrelator::SourceChangeOutcome::kIgnoredIdle:
      ++metrics_.dropped_after_stop;
      break;
  }
  metrics_.deferred_boundaries = correlator_.deferred_boundaries_total();
}

CaptureSession::StopResult CaptureSession::Stop() {
  return Stop(time_source_->NowUs());
}

CaptureSession::StopResult CaptureSession::Stop(int64_t stop_us) {
  std::lock_guard<std::mutex> stop_lock(stop_mutex_);
  if (stopped_) {
    StopResult again = last_stop_;
    again.stopped_now = false;
    return again;
  }

  stop_us_.store(stop_us, std::memory_order_release);
  tick_channel_.Close();
  source_channel_.Close();
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    stop_requested_ = true;
  }
  wake_cv_.notify_all();
  if (sequencer_.joinable()) {
    sequencer_.join();
  }
  stopped_ = true;
  active_.store(false, std::memory_order_release);

  if (fatal_error_) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_.session_active = false;
    std::rethrow_exception(fatal_error_);
  }

  const CutCorrelator::StopOutcome outcome = correlator_.Stop(stop_us);
  {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_.session_active = false;
    metrics_.unresolved_boundaries = outcome.unresolved_boundaries;
    metrics_.deferred_boundaries = correlator_.deferred_boundaries_total();
  }

  last_stop_ = {true, outcome.records, outcome.unresolved_boundaries, correlator_.log()};

  const telemetry::SessionMetrics m = Metrics();
  std::ostringstream oss;
  oss << "[CaptureSession] STOP id=" << session_id_
      << " records=" << outcome.records
      << " unresolved=" << outcome.unresolved_boundaries
      << " dropped=" << m.DroppedEventsTotal()
      << " duplicates=" << m.duplicates_suppressed
      << " discontinuities=" << m.discontinuities;
  util::Logger::Info(oss.str());
  return last_stop_;
}

std::vector<correlator::CutRecord> CaptureSession::Records() const {
  return correlator_.log()->Records();
}

timing::EstimateResult CaptureSession::EstimateAt(int64_t instant_us) const {
  return tracker_.EstimateAt(instant_us);
}

std::shared_ptr<const correlator::CutLog> CaptureSession::log() const {
  return correlator_.log();
}

telemetry::SessionMetrics CaptureSession::Metrics() const {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  return metrics_;
}

bool CaptureSession::IsActive() const {
  return active_.load(std::memory_order_acquire);
}

edl::ExportResult CaptureSession::Export() const {
  return edl::EdlExporter::Export(*correlator_.log(), config_.ToExportConfig());
}

}  // namespace cutlog::runtime
