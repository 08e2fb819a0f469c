// Repository: Retrovue-wavecast
// Component: Wavecast Server
// Purpose: Hosts the VisualizerControl gRPC service and the generation
//          worker until SIGINT or SIGTERM.
// Copyright (c) 2025 RetroVue

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "visualizer_service.h"
#include "wavecast/pipeline/GenerationWorker.hpp"
#include "wavecast/pipeline/PipelineConfig.hpp"
#include "wavecast/pipeline/PipelineController.hpp"
#include "wavecast/util/Logger.hpp"

namespace {

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct ServerArgs {
  std::string listen = "0.0.0.0:50061";
  int max_attempts = 3;
  int64_t timeout_sec = 300;
  size_t queue_depth = wavecast::pipeline::kDefaultMaxQueueDepth;
  bool verbose = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Runs the VisualizerControl gRPC service.\n"
            << "\n"
            << "  --listen ADDR        Listen address (default: 0.0.0.0:50061)\n"
            << "  --max-attempts N     Attempts per job including the first (default: 3)\n"
            << "  --timeout-sec N      Per-attempt deadline in seconds (default: 300)\n"
            << "  --queue-depth N      Jobs that may wait behind the running one (default: 8)\n"
            << "  --verbose            Enable debug logging\n"
            << "  --help               Show this help message\n";
}

ServerArgs ParseArgs(int argc, char* argv[]) {
  ServerArgs args;
  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--verbose" || arg == "-v") {
        args.verbose = true;
      } else if (arg == "--listen" && i + 1 < argc) {
        args.listen = argv[++i];
      } else if (arg == "--max-attempts" && i + 1 < argc) {
        args.max_attempts = std::stoi(argv[++i]);
      } else if (arg == "--timeout-sec" && i + 1 < argc) {
        args.timeout_sec = std::stoll(argv[++i]);
      } else if (arg == "--queue-depth" && i + 1 < argc) {
        args.queue_depth = static_cast<size_t>(std::stoul(argv[++i]));
      } else {
        args.error = "Unknown argument: " + arg;
        return args;
      }
    }
  } catch (const std::exception& e) {
    args.error = std::string("Bad numeric value: ") + e.what();
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
  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  using wavecast::util::Logger;

  const ServerArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 2;
  }

  if (args.verbose) Logger::SetDebugEnabled(true);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  wavecast::pipeline::PipelineConfig config;
  config.retry.max_attempts = args.max_attempts;
  config.attempt_timeout_ms = args.timeout_sec * 1000;

  auto controller = std::make_unique<wavecast::pipeline::PipelineController>(
      wavecast::pipeline::MakeProductionDependencies(), config);
  auto worker = std::make_shared<wavecast::pipeline::GenerationWorker>(std::move(controller),
                                                                       args.queue_depth);
  worker->Start();

  wavecast::service::VisualizerControlImpl service(worker);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(args.listen, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    Logger::Error("[wavecast_server] Failed to listen on " + args.listen);
    worker->Stop();
    return 1;
  }
  Logger::Info("[wavecast_server] Listening on " + args.listen);

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  Logger::Info("[wavecast_server] Shutdown requested");
  // Stopping the worker first completes every open GenerateVideo stream.
  worker->Stop();
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
  server->Wait();
  Logger::Info("[wavecast_server] Stopped");
  return 0;
}
