// Repository: Rewind
// Component: Thread-Safe Logger
// Purpose: Timestamped, level-tagged log lines that never interleave.
// Copyright (c) 2026 Rewind

#ifndef REWIND_UTIL_LOGGER_HPP_
#define REWIND_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace rwd::util {

// Logger is process-wide and static. Every call takes one mutex and writes
// a whole line, so the recorder loop, process waiters, export callers and
// gRPC handlers never interleave.
//
// Console format: "<UTC ISO-8601> <LEVEL> <line>".
//   Debug, Info -> stdout (Debug only when REWIND_DEBUG is set)
//   Warn, Error -> stderr
//
// Callers pass the line already prefixed with their component, e.g.
// "[BufferStore] evicted chunk_...".
class Logger {
 public:
  enum class Level { kDebug = 0, kInfo, kWarn, kError };

  using Sink = std::function<void(const std::string&)>;

  static void Debug(const std::string& line) { Emit(Level::kDebug, line); }
  static void Info(const std::string& line) { Emit(Level::kInfo, line); }
  static void Warn(const std::string& line) { Emit(Level::kWarn, line); }
  static void Error(const std::string& line) { Emit(Level::kError, line); }

  static bool DebugEnabled();

  // Test hook: sink receives each line of that level (without the timestamp
  // and level tag), in addition to the console. nullptr clears it.
  static void SetSink(Level level, Sink sink);

 private:
  static void Emit(Level level, const std::string& line);

  static std::mutex mutex_;
  static Sink sinks_[4];
};

const char* LevelName(Logger::Level level);

}  // namespace rwd::util

#endif  // REWIND_UTIL_LOGGER_HPP_
