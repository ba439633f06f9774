// Repository: CutLog
// Component: Session Metrics
// Purpose: Passive counters for one capture session
// Copyright (c) 2026 CutLog
//
// These metrics are passive observations only. They never affect correlation.

#ifndef CUTLOG_TELEMETRY_SESSION_METRICS_HPP_
#define CUTLOG_TELEMETRY_SESSION_METRICS_HPP_

#include <cstdint>
#include <sstream>
#include <string>

namespace cutlog::telemetry {

// Written by the session sequencer (and by producers for the receive/drop
// counters), read through CaptureSession::Metrics() which returns a copy.
struct SessionMetrics {
  std::string session_id;
  bool session_active = false;

  // ---- Recorder stream ----
  uint64_t ticks_received = 0;
  uint64_t ticks_applied = 0;
  uint64_t ticks_rejected = 0;          // Rate / counting-mode mismatch
  uint64_t discontinuities = 0;         // Backward timecode moves

  // ---- Switcher stream ----
  uint64_t source_events_received = 0;
  uint64_t source_events_applied = 0;
  uint64_t duplicates_suppressed = 0;
  uint64_t late_source_events = 0;      // Observed before the open record began

  // ---- Loss ----
  uint64_t dropped_after_stop = 0;      // Posted after, or observed after, Stop()
  uint64_t channel_overflow_total = 0;  // Rejected by a full channel

  // ---- Cut log ----
  uint64_t cuts_recorded = 0;           // Records opened
  uint64_t deferred_boundaries = 0;     // Timecode resolved late (or never)
  uint64_t unresolved_boundaries = 0;   // Still unresolved at stop

  uint64_t DroppedEventsTotal() const { return dropped_after_stop + channel_overflow_total; }

  std::string GeneratePrometheusText() const {
    std::ostringstream oss;
    const std::string labels = "{session=\"" + session_id + "\"}";

    auto gauge = [&](const char* name, const char* help, uint64_t value) {
      oss << "# HELP " << name << " " << help << "\n";
      oss << "# TYPE " << name << " gauge\n";
      oss << name << labels << " " << value << "\n";
    };
    auto counter = [&](const char* name, const char* help, uint64_t value) {
      oss << "# HELP " << name << " " << help << "\n";
      oss << "# TYPE " << name << " counter\n";
      oss << name << labels << " " << value << "\n";
    };

    gauge("cutlog_session_active", "1 while the capture session accepts events",
          session_active ? 1 : 0);
    counter("cutlog_ticks_received_total", "Recorder readings posted", ticks_received);
    counter("cutlog_ticks_applied_total", "Recorder readings applied to the tracker",
            ticks_applied);
    counter("cutlog_ticks_rejected_total", "Recorder readings with the wrong rate",
            ticks_rejected);
    counter("cutlog_timecode_discontinuities_total", "Backward recorder timecode moves",
            discontinuities);
    counter("cutlog_source_events_received_total", "Switcher source changes posted",
            source_events_received);
    counter("cutlog_source_events_applied_total", "Switcher source changes applied",
            source_events_applied);
    counter("cutlog_duplicate_source_events_total", "Redundant source changes suppressed",
            duplicates_suppressed);
    counter("cutlog_late_source_events_total", "Source changes older than the open record",
            late_source_events);
    counter("cutlog_dropped_after_stop_total", "Events discarded after stop",
            dropped_after_stop);
    counter("cutlog_channel_overflow_total", "Events rejected by a full channel",
            channel_overflow_total);
    gauge("cutlog_cuts_recorded", "Cut records opened this session", cuts_recorded);
    counter("cutlog_deferred_boundaries_total", "Cut boundaries whose timecode was deferred",
            deferred_boundaries);
    gauge("cutlog_unresolved_boundaries", "Cut boundaries unresolved at stop",
          unresolved_boundaries);
    return oss.str();
  }
};

}  // namespace cutlog::telemetry

#endif  // CUTLOG_TELEMETRY_SESSION_METRICS_HPP_
