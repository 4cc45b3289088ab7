// Repository: AudioInject
// Component: Thread-Safe Logger
// Purpose: Level-tagged, line-at-a-time log emission for the tools and the
//          pipeline stages.
// Copyright (c) 2026 AudioInject

#include "audioinject/util/Logger.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace audioinject::util {

namespace {

std::mutex g_log_mutex;

Logger::CaptureSink g_capture_sink;
Logger::Level g_capture_min_level = Logger::Level::kError;

// -1 = not yet read from the environment.
std::atomic<int> g_debug_enabled{-1};

std::ostream& StreamFor(Logger::Level level) {
  return (level == Logger::Level::kWarn || level == Logger::Level::kError) ? std::cerr
                                                                             : std::cout;
}

}  // namespace

const char* ToString(Logger::Level level) {
  switch (level) {
    case Logger::Level::kDebug: return "debug";
    case Logger::Level::kInfo: return "info";
    case Logger::Level::kWarn: return "warn";
    case Logger::Level::kError: return "error";
  }
  return "unknown";
}

bool Logger::DebugEnabled() {
  int state = g_debug_enabled.load(std::memory_order_acquire);
  if (state < 0) {
    state = std::getenv("AUDIOINJECT_DEBUG") != nullptr ? 1 : 0;
    g_debug_enabled.store(state, std::memory_order_release);
  }
  return state == 1;
}

void Logger::SetDebugEnabled(bool enabled) {
  g_debug_enabled.store(enabled ? 1 : 0, std::memory_order_release);
}

void Logger::SetCaptureSink(Level min_level, CaptureSink sink) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_capture_min_level = min_level;
  g_capture_sink = std::move(sink);
}

void Logger::ClearCaptureSink() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_capture_sink = nullptr;
}

void Logger::Emit(Level level, const std::string& line) {
  if (level == Level::kDebug && !DebugEnabled()) return;

  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_capture_sink && level >= g_capture_min_level) {
    g_capture_sink(level, line);
  }
  std::ostream& out = StreamFor(level);
  out << line << '\n';
  out.flush();
}

}  // namespace audioinject::util
