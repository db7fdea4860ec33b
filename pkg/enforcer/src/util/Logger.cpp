// Repository: Mapcycle-enforcer
// Component: Thread-Safe Logger
// Purpose: Mutex-protected, level-filtered log emission.
// Copyright (c) 2026 RetroVue

#include "mapcycle/util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <utility>

namespace mapcycle::util {

std::mutex Logger::mutex_;
LogLevel Logger::level_ = LogLevel::kInfo;
Logger::Sink Logger::sink_;

namespace {

std::string UtcTimestamp() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const std::time_t secs = system_clock::to_time_t(now);
  const auto millis =
      duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm_utc{};
  gmtime_r(&secs, &tm_utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_utc);
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(millis));
  return out;
}

}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo:  return "INFO";
    case LogLevel::kWarn:  return "WARN";
    case LogLevel::kError: return "ERROR";
  }
  return "INFO";
}

std::optional<LogLevel> ParseLogLevel(const std::string& raw) {
  std::string upper = raw;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (upper == "DEBUG") return LogLevel::kDebug;
  if (upper == "INFO") return LogLevel::kInfo;
  if (upper == "WARN" || upper == "WARNING") return LogLevel::kWarn;
  if (upper == "ERROR") return LogLevel::kError;
  return std::nullopt;
}

void Logger::SetLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

LogLevel Logger::Level() {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

void Logger::SetSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
}

void Logger::Debug(const std::string& line) { Emit(LogLevel::kDebug, line); }
void Logger::Info(const std::string& line) { Emit(LogLevel::kInfo, line); }
void Logger::Warn(const std::string& line) { Emit(LogLevel::kWarn, line); }
void Logger::Error(const std::string& line) { Emit(LogLevel::kError, line); }

void Logger::Emit(LogLevel level, const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (static_cast<int>(level) < static_cast<int>(level_)) return;
  if (sink_) {
    sink_(level, line);
  }
  std::ostream& out = (level >= LogLevel::kWarn) ? std::cerr : std::cout;
  out << '[' << UtcTimestamp() << "] [" << LogLevelName(level) << "] " << line << '\n';
  out.flush();
}

}  // namespace mapcycle::util
