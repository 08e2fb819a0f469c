// Repository: Retrovue-wavecast
// Component: Wavecast CLI
// Purpose: Runs a single generation from the command line, printing progress.
// Copyright (c) 2025 RetroVue
//
// Exit codes: 0 success, 1 generation failed, 2 usage error.

#include <atomic>
#include <cctype>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "wavecast/pipeline/GenerationTypes.hpp"
#include "wavecast/pipeline/PipelineConfig.hpp"
#include "wavecast/pipeline/PipelineController.hpp"
#include "wavecast/util/Logger.hpp"

namespace {

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_cancel_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_cancel_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string input;
  std::string output;
  std::string username;
  std::string accent;   // RRGGBB
  std::string avatar;   // Path or URL
  double duration_hint_sec = 0.0;
  int max_attempts = 3;
  int64_t timeout_sec = 300;
  uint32_t points = 0;
  bool verbose = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --input PATH --output PATH --username NAME [OPTIONS]\n"
            << "\n"
            << "Renders an audio clip into an MP4 with waveform bars, avatar and countdown.\n"
            << "\n"
            << "  --input PATH         Audio file (any container FFmpeg can read)\n"
            << "  --output PATH        Output MP4 path\n"
            << "  --username NAME      Handle shown in the top-right corner\n"
            << "  --accent RRGGBB      Background color (default: 1D9BF0)\n"
            << "  --avatar PATH|URL    Avatar image (PNG or JPEG)\n"
            << "  --duration-hint SEC  Duration to use when the container reports none\n"
            << "  --max-attempts N     Attempts including the first (default: 3)\n"
            << "  --timeout-sec N      Per-attempt deadline in seconds (default: 300)\n"
            << "  --points N           Waveform points, 1..500 (default: 200)\n"
            << "  --verbose            Enable debug logging\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "EXAMPLE:\n"
            << "    " << program_name
            << " --input memo.m4a --output memo.mp4 --username alice --accent FF6600\n";
}

bool ParseAccent(const std::string& text, wavecast::render::Rgba* out) {
  std::string hex = text;
  if (!hex.empty() && hex[0] == '#') hex = hex.substr(1);
  if (hex.size() != 6) return false;
  for (char c : hex) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
  }
  const unsigned long value = std::stoul(hex, nullptr, 16);
  *out = wavecast::render::Rgba(static_cast<uint8_t>(value >> 16),
                                static_cast<uint8_t>(value >> 8),
                                static_cast<uint8_t>(value), 255);
  return true;
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--verbose" || arg == "-v") {
        args.verbose = true;
      } else if (arg == "--input" && i + 1 < argc) {
        args.input = argv[++i];
      } else if (arg == "--output" && i + 1 < argc) {
        args.output = argv[++i];
      } else if (arg == "--username" && i + 1 < argc) {
        args.username = argv[++i];
      } else if (arg == "--accent" && i + 1 < argc) {
        args.accent = argv[++i];
      } else if (arg == "--avatar" && i + 1 < argc) {
        args.avatar = argv[++i];
      } else if (arg == "--duration-hint" && i + 1 < argc) {
        args.duration_hint_sec = std::stod(argv[++i]);
      } else if (arg == "--max-attempts" && i + 1 < argc) {
        args.max_attempts = std::stoi(argv[++i]);
      } else if (arg == "--timeout-sec" && i + 1 < argc) {
        args.timeout_sec = std::stoll(argv[++i]);
      } else if (arg == "--points" && i + 1 < argc) {
        args.points = static_cast<uint32_t>(std::stoul(argv[++i]));
      } else {
        args.error = "Unknown argument: " + arg;
        return args;
      }
    }
  } catch (const std::exception& e) {
    args.error = std::string("Bad numeric value: ") + e.what();
    return args;
  }

  if (args.input.empty() || args.output.empty()) {
    args.error = "--input and --output are required";
    return args;
  }
  if (args.username.empty()) {
    args.error = "--username is required";
    return args;
  }
  if (args.max_attempts < 1) {
    args.error = "--max-attempts must be at least 1";
    return args;
  }
  if (args.timeout_sec < 1) {
    args.error = "--timeout-sec must be at least 1";
    return args;
  }
  if (args.points > 500) {
    args.error = "--points must be at most 500";
    return args;
  }
  if (args.duration_hint_sec < 0.0) {
    args.error = "--duration-hint must not be negative";
    return args;
  }

  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace wavecast::pipeline;

  const CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 2;
  }

  if (args.verbose) wavecast::util::Logger::SetDebugEnabled(true);

  GenerationRequest request;
  request.job_id = "cli";
  request.input_uri = args.input;
  request.output_path = args.output;
  request.username = args.username;
  request.avatar.uri = args.avatar;
  request.duration_hint_sec = args.duration_hint_sec;
  request.waveform_points = args.points;
  if (!args.accent.empty() && !ParseAccent(args.accent, &request.accent)) {
    std::cerr << "Error: --accent expects RRGGBB, got " << args.accent << "\n";
    return 2;
  }

  PipelineConfig config;
  config.retry.max_attempts = args.max_attempts;
  config.attempt_timeout_ms = args.timeout_sec * 1000;

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  PipelineController controller(MakeProductionDependencies(), config);

  int last_percent = -1;
  const GenerationResult result =
      controller.Run(request, g_cancel_requested, [&last_percent](const ProgressUpdate& update) {
        const int percent = static_cast<int>(update.progress * 100.0);
        if (percent == last_percent && update.state != PipelineState::kFailed) return;
        last_percent = percent;
        std::cout << "[wavecast] attempt " << update.attempt << " " << std::setw(3) << percent
                  << "% " << PipelineStateToString(update.state) << std::endl;
      });

  if (result.success) {
    std::cout << "[wavecast] Wrote " << result.output_path << " (attempts=" << result.attempts
              << ")" << std::endl;
    return 0;
  }

  std::cerr << "[wavecast] Failed: " << GenerationErrorToString(result.error);
  if (result.underlying != result.error) {
    std::cerr << " (last error " << GenerationErrorToString(result.underlying) << ")";
  }
  std::cerr << ": " << result.detail << " attempts=" << result.attempts << std::endl;
  return 1;
}
