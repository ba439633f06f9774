// Repository: CutLog
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission for switcher, recorder and sequencer threads.
// Copyright (c) 2026 CutLog

#include "cutlog/util/Logger.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace cutlog::util {

std::mutex Logger::mutex_;
bool Logger::info_to_stderr_ = false;
std::function<void(const std::string&)> Logger::warn_sink_;
std::function<void(const std::string&)> Logger::error_sink_;

void Logger::SetWarnSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetInfoToStderr(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_to_stderr_ = enabled;
}

bool Logger::InfoToStderr() {
  std::lock_guard<std::mutex> lock(mutex_);
  return info_to_stderr_;
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ostream& out = info_to_stderr_ ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
}

void Logger::Debug(const std::string& line) {
  if (std::getenv("CUTLOG_DEBUG") == nullptr) return;
  std::lock_guard<std::mutex> lock(mutex_);
  std::ostream& out = info_to_stderr_ ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (warn_sink_) {
    warn_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

}  // namespace cutlog::util
