// Repository: Retrovue-wavecast
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the pipeline, the worker
//          thread and gRPC handlers.
// Copyright (c) 2025 RetroVue

#include "wavecast/util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace wavecast::util {

std::mutex Logger::mutex_;
std::array<Logger::Sink, 4> Logger::sinks_;
std::atomic<int> Logger::debug_state_{-1};

const char* LogLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "debug";
    case LogLevel::kInfo: return "info";
    case LogLevel::kWarn: return "warn";
    case LogLevel::kError: return "error";
  }
  return "unknown";
}

void Logger::SetDebugEnabled(bool enabled) {
  debug_state_.store(enabled ? 1 : 0);
}

bool Logger::DebugEnabled() {
  int state = debug_state_.load();
  if (state < 0) {
    state = std::getenv("WAVECAST_DEBUG") != nullptr ? 1 : 0;
    int expected = -1;
    // A concurrent SetDebugEnabled wins over the environment.
    if (!debug_state_.compare_exchange_strong(expected, state)) state = expected;
  }
  return state == 1;
}

void Logger::SetSink(LogLevel level, Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_[static_cast<size_t>(level)] = std::move(sink);
}

void Logger::Emit(LogLevel level, const std::string& line) {
  if (level == LogLevel::kDebug && !DebugEnabled()) return;

  std::lock_guard<std::mutex> lock(mutex_);
  const Sink& sink = sinks_[static_cast<size_t>(level)];
  if (sink) sink(line);

  std::ostream& out = level >= LogLevel::kWarn ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
}

}  // namespace wavecast::util
