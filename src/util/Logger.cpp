// Repository: Rewind
// Component: Thread-Safe Logger
// Purpose: Timestamped, level-tagged log lines that never interleave.
// Copyright (c) 2026 Rewind

#include "rewind/util/Logger.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <utility>

#include "rewind/util/Timestamp.hpp"

namespace rwd::util {

namespace {

int64_t NowUtcMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace

std::mutex Logger::mutex_;
Logger::Sink Logger::sinks_[4];

const char* LevelName(Logger::Level level) {
  switch (level) {
    case Logger::Level::kDebug: return "DEBUG";
    case Logger::Level::kInfo: return "INFO";
    case Logger::Level::kWarn: return "WARN";
    case Logger::Level::kError: return "ERROR";
  }
  return "?";
}

bool Logger::DebugEnabled() {
  static const bool enabled = std::getenv("REWIND_DEBUG") != nullptr;
  return enabled;
}

void Logger::SetSink(Level level, Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_[static_cast<int>(level)] = std::move(sink);
}

void Logger::Emit(Level level, const std::string& line) {
  if (level == Level::kDebug && !DebugEnabled()) return;

  const std::string stamped =
      FormatUtcIso8601(NowUtcMs()) + " " + LevelName(level) + " " + line;
  std::ostream& out = (level >= Level::kWarn) ? std::cerr : std::cout;

  std::lock_guard<std::mutex> lock(mutex_);
  const Sink& sink = sinks_[static_cast<int>(level)];
  if (sink) sink(line);
  out << stamped << '\n';
  out.flush();
}

}  // namespace rwd::util
