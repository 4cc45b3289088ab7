// Repository: AudioInject
// Component: Thread-Safe Logger
// Purpose: Level-tagged, line-at-a-time log emission for the tools and the
//          pipeline stages.
// Copyright (c) 2026 AudioInject

#ifndef AUDIOINJECT_UTIL_LOGGER_HPP_
#define AUDIOINJECT_UTIL_LOGGER_HPP_

#include <functional>
#include <string>

namespace audioinject::util {

// Every call writes one full line under a single process-wide mutex, so
// lines from the pacing thread, gRPC completion threads and the stub's
// accept thread never interleave.  Callers prefix lines with their
// component tag ("[WaveSource] ...").
//
// Info  → stdout
// Debug → stdout, only while debug output is enabled (AUDIOINJECT_DEBUG)
// Warn  → stderr
// Error → stderr; the one-line diagnostic a tool exits on
class Logger {
 public:
  enum class Level { kDebug, kInfo, kWarn, kError };

  static void Debug(const std::string& line) { Emit(Level::kDebug, line); }
  static void Info(const std::string& line) { Emit(Level::kInfo, line); }
  static void Warn(const std::string& line) { Emit(Level::kWarn, line); }
  static void Error(const std::string& line) { Emit(Level::kError, line); }

  // Initialised from AUDIOINJECT_DEBUG on first use.
  static bool DebugEnabled();
  static void SetDebugEnabled(bool enabled);

  // Test-only: sink receives every emitted line at or above min_level, in
  // addition to the stream.  ClearCaptureSink() removes it.
  using CaptureSink = std::function<void(Level, const std::string&)>;
  static void SetCaptureSink(Level min_level, CaptureSink sink);
  static void ClearCaptureSink();

 private:
  static void Emit(Level level, const std::string& line);
};

const char* ToString(Logger::Level level);

}  // namespace audioinject::util

#endif  // AUDIOINJECT_UTIL_LOGGER_HPP_
