// Repository: CutLog
// Component: Replay Runner
// Purpose: Runs one replay script through a capture session and emits the EDL
// Copyright (c) 2026 CutLog

#pragma once

#include <string>

#include "ReplayScript.hpp"
#include "cutlog/runtime/CaptureConfig.h"

namespace cutlog::standalone {

struct ReplayOptions {
  runtime::CaptureConfig config;
  // Empty: the EDL goes to stdout and nothing else does.
  std::string output_path;
  // Metrics text to stderr after export.
  bool print_metrics = false;
};

// Exit codes for cutlog_replay.
constexpr int kReplayOk = 0;
constexpr int kReplayStartFailed = 1;
constexpr int kReplayExportFailed = 2;

// The switcher and recorder streams are posted from two threads, the way the
// device collaborators deliver them live. The session's clock is pinned at
// the script's stop instant and its reorder window spans the whole script,
// so both streams are merged in observed order at stop.
//
// While the EDL is written to stdout, log Info lines are routed to stderr.
int RunReplay(const ReplayScript& script, ReplayOptions options);

}  // namespace cutlog::standalone
