// Repository: Retrovue-wavecast
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the pipeline, the worker
//          thread and gRPC handlers.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_UTIL_LOGGER_HPP_
#define WAVECAST_UTIL_LOGGER_HPP_

#include <array>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace wavecast::util {

enum class LogLevel { kDebug = 0, kInfo, kWarn, kError };

const char* LogLevelToString(LogLevel level);

// Static line logger. Every call writes one whole line under a single mutex,
// so output from the generation worker, FFmpeg interrupt paths and gRPC
// handlers never interleaves.
//
//   Debug, Info -> stdout (Debug only when enabled)
//   Warn, Error -> stderr
//
// Debug starts enabled when WAVECAST_DEBUG is set; the executables also turn
// it on for --verbose. A sink installed for a level sees each of its lines
// before the console does; pass nullptr to remove it.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Debug(const std::string& line) { Emit(LogLevel::kDebug, line); }
  static void Info(const std::string& line) { Emit(LogLevel::kInfo, line); }
  static void Warn(const std::string& line) { Emit(LogLevel::kWarn, line); }
  static void Error(const std::string& line) { Emit(LogLevel::kError, line); }

  static void SetDebugEnabled(bool enabled);
  static bool DebugEnabled();

  static void SetSink(LogLevel level, Sink sink);
  static void SetInfoSink(Sink sink) { SetSink(LogLevel::kInfo, std::move(sink)); }
  static void SetWarnSink(Sink sink) { SetSink(LogLevel::kWarn, std::move(sink)); }
  static void SetErrorSink(Sink sink) { SetSink(LogLevel::kError, std::move(sink)); }

 private:
  static void Emit(LogLevel level, const std::string& line);

  static std::mutex mutex_;
  static std::array<Sink, 4> sinks_;
  static std::atomic<int> debug_state_;  // -1 unresolved, 0 off, 1 on
};

}  // namespace wavecast::util

#endif  // WAVECAST_UTIL_LOGGER_HPP_
