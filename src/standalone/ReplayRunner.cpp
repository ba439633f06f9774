// Repository: CutLog
// Component: Replay Runner
// Copyright (c) 2026 CutLog

#include "ReplayRunner.hpp"

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <thread>

#include "cutlog/edl/EdlExporter.h"
#include "cutlog/runtime/CaptureSession.h"
#include "cutlog/time/ITimeSource.hpp"
#include "cutlog/util/Logger.hpp"

namespace cutlog::standalone {

namespace {

// Pins "now" at the script's stop instant.
class ScriptTimeSource : public ITimeSource {
 public:
  explicit ScriptTimeSource(int64_t now_us) : now_us_(now_us) {}
  int64_t NowUs() const override { return now_us_; }

 private:
  int64_t now_us_;
};

// Restores the Logger's Info routing on scope exit.
class InfoRouting {
 public:
  explicit InfoRouting(bool to_stderr) : previous_(util::Logger::InfoToStderr()) {
    util::Logger::SetInfoToStderr(to_stderr || previous_);
  }
  ~InfoRouting() { util::Logger::SetInfoToStderr(previous_); }

  InfoRouting(const InfoRouting&) = delete;
  InfoRouting& operator=(const InfoRouting&) = delete;

 private:
  bool previous_;
};

}  // namespace

int RunReplay(const ReplayScript& script, ReplayOptions options) {
  const bool edl_to_stdout = options.output_path.empty();
  InfoRouting routing(edl_to_stdout);

  const int64_t stop_us = script.StopInstantUs();
  options.config.reorder_window_ms = stop_us / 1'000 + 1;
  const size_t events = script.ticks.size() + script.sources.size();
  if (options.config.channel_capacity < events) {
    options.config.channel_capacity = events;
  }

  auto started = runtime::CaptureSession::Start(
      options.config, std::make_shared<ScriptTimeSource>(stop_us), "replay");
  if (!started.ok) {
    std::cerr << "[REPLAY] session start failed: "
              << runtime::SessionStartErrorToString(started.error) << " " << started.detail
              << "\n";
    return kReplayStartFailed;
  }
  runtime::CaptureSession& session = *started.session;

  std::thread recorder([&] {
    for (const auto& tick : script.ticks) session.OnTimecodeTick(tick);
  });
  std::thread switcher([&] {
    for (const auto& change : script.sources) session.OnSourceChanged(change);
  });
  recorder.join();
  switcher.join();

  const auto stopped = session.Stop(stop_us);
  const auto export_config = options.config.ToExportConfig();
  const auto result =
      edl_to_stdout
          ? edl::EdlExporter::Export(*stopped.log, export_config)
          : edl::EdlExporter::ExportToFile(*stopped.log, export_config, options.output_path);

  if (options.print_metrics) {
    std::cerr << session.Metrics().GeneratePrometheusText();
  }
  if (!result.ok) {
    std::cerr << "[REPLAY] export failed: " << edl::EdlExportErrorToString(result.error) << " "
              << result.detail << "\n";
    return kReplayExportFailed;
  }
  if (edl_to_stdout) {
    std::cout << result.bytes;
    std::cout.flush();
  }
  return kReplayOk;
}

}  // namespace cutlog::standalone
