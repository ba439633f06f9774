// Repository: CutLog
// Component: Replay Harness
// Purpose: Drives a capture session from a recorded event script and prints the EDL
// Copyright (c) 2026 CutLog

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

#include "ReplayRunner.hpp"
#include "ReplayScript.hpp"
#include "cutlog/runtime/CaptureConfig.h"

namespace {

struct CliArgs {
  std::string script_path;
  std::string output_path;
  cutlog::runtime::CaptureConfig config;
  bool print_metrics = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS] SCRIPT\n"
            << "\n"
            << "Replays a switcher/recorder event script through a capture session\n"
            << "and prints the resulting EDL.\n"
            << "\n"
            << "SCRIPT LINES (times in milliseconds):\n"
            << "  tick <ms> <timecode> <playing|stopped|paused|shuttling|unknown>\n"
            << "  source <ms> <id> <label...>\n"
            << "  stop <ms>\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --fps RATE           23.976, 24, 25, 29.97, 30 (default: 29.97)\n"
            << "  --drop-frame         Drop-frame counting (default at 29.97)\n"
            << "  --non-drop-frame     Non-drop-frame counting\n"
            << "  --offset FRAMES      Signed frame offset compensation (default: 0)\n"
            << "  --stale-ms MS        Timecode staleness threshold (default: 2000)\n"
            << "  --reject-empty       Fail instead of writing a header-only EDL\n"
            << "  --title TEXT         EDL title (default: Program Output)\n"
            << "  --output PATH        Write the EDL to PATH instead of stdout\n"
            << "  --metrics            Print session metrics to stderr\n"
            << "  --help               Show this help message\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  bool df_explicit = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto need_value = [&](const char* flag) -> const char* {
      if (i + 1 >= argc) {
        args.error = std::string(flag) + " requires a value";
        return nullptr;
      }
      return argv[++i];
    };

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      return args;
    } else if (arg == "--fps") {
      const char* v = need_value("--fps");
      if (v == nullptr) return args;
      const auto rate = cutlog::runtime::ParseFrameRate(v);
      if (!rate.has_value()) {
        args.error = std::string("unknown frame rate '") + v + "'";
        return args;
      }
      args.config.frame_rate = *rate;
    } else if (arg == "--drop-frame") {
      args.config.drop_frame = true;
      df_explicit = true;
    } else if (arg == "--non-drop-frame") {
      args.config.drop_frame = false;
      df_explicit = true;
    } else if (arg == "--offset") {
      const char* v = need_value("--offset");
      if (v == nullptr) return args;
      char* end = nullptr;
      args.config.frame_offset = std::strtoll(v, &end, 10);
      if (end == v || *end != '\0') {
        args.error = std::string("bad --offset '") + v + "'";
        return args;
      }
    } else if (arg == "--stale-ms") {
      const char* v = need_value("--stale-ms");
      if (v == nullptr) return args;
      char* end = nullptr;
      args.config.staleness_threshold_ms = std::strtoll(v, &end, 10);
      if (end == v || *end != '\0') {
        args.error = std::string("bad --stale-ms '") + v + "'";
        return args;
      }
    } else if (arg == "--reject-empty") {
      args.config.reject_empty_export = true;
    } else if (arg == "--title") {
      const char* v = need_value("--title");
      if (v == nullptr) return args;
      args.config.edl_title = v;
    } else if (arg == "--output") {
      const char* v = need_value("--output");
      if (v == nullptr) return args;
      args.output_path = v;
    } else if (arg == "--metrics") {
      args.print_metrics = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option " + arg;
      return args;
    } else if (args.script_path.empty()) {
      args.script_path = arg;
    } else {
      args.error = "more than one script given";
      return args;
    }
  }

  // Drop-frame only exists at 29.97 / 59.94; follow the rate unless told.
  if (!df_explicit) {
    args.config.drop_frame = args.config.frame_rate.IsNtscRate() &&
                             args.config.frame_rate.NominalFps() % 30 == 0;
  }
  if (args.script_path.empty()) {
    args.error = "no script given";
    return args;
  }
  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "[REPLAY] " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  std::ifstream script_file(args.script_path);
  if (!script_file) {
    std::cerr << "[REPLAY] cannot open " << args.script_path << "\n";
    return 1;
  }
  const auto parsed = cutlog::standalone::ParseReplayScript(
      script_file, args.config.frame_rate, args.config.drop_frame);
  if (!parsed.ok) {
    std::cerr << "[REPLAY] " << args.script_path << ":" << parsed.error_line << ": "
              << parsed.error << "\n";
    return 1;
  }

  cutlog::standalone::ReplayOptions options;
  options.config = args.config;
  options.output_path = args.output_path;
  options.print_metrics = args.print_metrics;
  return cutlog::standalone::RunReplay(parsed.script, options);
}
