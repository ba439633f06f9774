// Repository: CutLog
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission for switcher, recorder and sequencer threads.
// Copyright (c) 2026 CutLog

#ifndef CUTLOG_UTIL_LOGGER_HPP_
#define CUTLOG_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace cutlog::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes. No interleave between the device producer threads and the
// session sequencer.
//
// Info  → stdout (session lifecycle, cuts)
// Debug → stdout only when CUTLOG_DEBUG env is set
//
// Tools that write their product to stdout (cutlog_replay's EDL) call
// SetInfoToStderr(true) so Info and Debug lines go to stderr instead.
// Warn  → stderr (discontinuities, dropped events, unresolved timecode)
// Error → stderr (invariant violations)
//
// Test-only: SetWarnSink / SetErrorSink install a callback invoked for every
// Warn() / Error() line (in addition to stderr).
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetInfoToStderr(bool enabled);
  static bool InfoToStderr();

  // Call with nullptr to clear.
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static bool info_to_stderr_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace cutlog::util

#endif  // CUTLOG_UTIL_LOGGER_HPP_
