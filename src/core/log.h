// Leveled stderr logging in printf style.

#ifndef MIDILIGHT_CORE_LOG_H
#define MIDILIGHT_CORE_LOG_H

#include <cstdint>

namespace midilight {

/// Log severity, lowest to highest.
enum class LogLevel : uint8_t {
  Debug,
  Info,
  Warning,
  Error
};

/// @brief Set the minimum level written to stderr (default Info).
void setLogLevel(LogLevel level);

/// @brief Current minimum level.
LogLevel logLevel();

/// @brief True if messages at this level are currently written.
bool isLogEnabled(LogLevel level);

// Each call formats with vsnprintf and writes one "[LEVEL] message" line to
// stderr when the level is enabled.
#if defined(__GNUC__)
void logMessage(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void logDebug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void logInfo(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void logWarn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void logError(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
#else
void logMessage(LogLevel level, const char* fmt, ...);
void logDebug(const char* fmt, ...);
void logInfo(const char* fmt, ...);
void logWarn(const char* fmt, ...);
void logError(const char* fmt, ...);
#endif

}  // namespace midilight

#endif  // MIDILIGHT_CORE_LOG_H
