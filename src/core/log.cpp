/// @file
/// @brief stderr logger.

#include "core/log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace midilight {

namespace {

std::atomic<LogLevel> g_log_level{LogLevel::Info};

// Scheduler worker and event loop both log; keep lines whole.
std::mutex g_log_mutex;

const char* levelTag(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:   return "DEBUG";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error:   return "ERROR";
  }
  return "?";
}

}  // namespace

void setLogLevel(LogLevel level) { g_log_level.store(level); }

LogLevel logLevel() { return g_log_level.load(); }

bool isLogEnabled(LogLevel level) {
  return static_cast<uint8_t>(level) >= static_cast<uint8_t>(g_log_level.load());
}

namespace {

void writeMessage(LogLevel level, const char* fmt, va_list args) {
  char buf[512];
  std::vsnprintf(buf, sizeof(buf), fmt, args);

  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::fprintf(stderr, "[%s] %s\n", levelTag(level), buf);
}

}  // namespace

void logMessage(LogLevel level, const char* fmt, ...) {
  if (!isLogEnabled(level)) {
    return;
  }
  va_list args;
  va_start(args, fmt);
  writeMessage(level, fmt, args);
  va_end(args);
}

void logDebug(const char* fmt, ...) {
  if (!isLogEnabled(LogLevel::Debug)) {
    return;
  }
  va_list args;
  va_start(args, fmt);
  writeMessage(LogLevel::Debug, fmt, args);
  va_end(args);
}

void logInfo(const char* fmt, ...) {
  if (!isLogEnabled(LogLevel::Info)) {
    return;
  }
  va_list args;
  va_start(args, fmt);
  writeMessage(LogLevel::Info, fmt, args);
  va_end(args);
}

void logWarn(const char* fmt, ...) {
  if (!isLogEnabled(LogLevel::Warning)) {
    return;
  }
  va_list args;
  va_start(args, fmt);
  writeMessage(LogLevel::Warning, fmt, args);
  va_end(args);
}

void logError(const char* fmt, ...) {
  if (!isLogEnabled(LogLevel::Error)) {
    return;
  }
  va_list args;
  va_start(args, fmt);
  writeMessage(LogLevel::Error, fmt, args);
  va_end(args);
}

}  // namespace midilight
