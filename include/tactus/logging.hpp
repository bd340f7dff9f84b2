#pragma once

#include "tactus/compiler_attributes.hpp"

#include <string>

namespace tactus {

enum class LogLevel {
  Error = 0,
  Warn = 10,
  Info = 20,
  Debug = 30,
};

/*
 * Logging is off until something calls logToStderr, which prints everything at `level` and below.  Nothing here
 * allocates once a thread has set its purpose, so it is safe to log from the heartbeat.
 * */
void logToStderr(LogLevel level = LogLevel::Error);

/*
 * Tag the calling thread so that log lines say where they came from.
 * */
void setThreadPurpose(std::string purpose);

void log(LogLevel level, const char *format, ...) PRINTF_LIKE(2, 3);

template <typename... ARGS> void logError(const char *format, ARGS... args) { log(LogLevel::Error, format, args...); }

template <typename... ARGS> void logWarn(const char *format, ARGS... args) { log(LogLevel::Warn, format, args...); }

template <typename... ARGS> void logInfo(const char *format, ARGS... args) { log(LogLevel::Info, format, args...); }

template <typename... ARGS> void logDebug(const char *format, ARGS... args) { log(LogLevel::Debug, format, args...); }

} // namespace tactus
