// Repository: Mapcycle-enforcer
// Component: Thread-Safe Logger
// Purpose: Mutex-protected, level-filtered log emission.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_UTIL_LOGGER_HPP_
#define MAPCYCLE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace mapcycle::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);

// Parses DEBUG/INFO/WARN/WARNING/ERROR (case-insensitive).
// Returns nullopt for anything else.
std::optional<LogLevel> ParseLogLevel(const std::string& raw);

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so the loop thread and gRPC handler threads never interleave.
//
// Lines are formatted as "[<utc timestamp>] [<LEVEL>] <message>".
//
// Debug, Info → stdout
// Warn, Error → stderr
//
// Lines below the threshold (SetLevel, default Info) are dropped.
//
// Test-only: SetSink installs a callback that receives every emitted line
// with its level (after filtering). Call with nullptr to clear.
class Logger {
 public:
  using Sink = std::function<void(LogLevel, const std::string&)>;

  static void Debug(const std::string& line);
  static void Info(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetLevel(LogLevel level);
  static LogLevel Level();

  static void SetSink(Sink sink);

 private:
  static void Emit(LogLevel level, const std::string& line);

  static std::mutex mutex_;
  static LogLevel level_;
  static Sink sink_;
};

}  // namespace mapcycle::util

#endif  // MAPCYCLE_UTIL_LOGGER_HPP_
