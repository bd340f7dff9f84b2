#include "tactus/logging.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <string>
#include <utility>

namespace tactus {

/*
 * Lines go straight to stderr from whichever thread logs, heartbeat included.  Keep logging off the per-tick path.
 * */

// The most verbose level which gets printed, or -1 while logging is off.
static std::atomic<int> max_level{-1};

thread_local static std::string thread_purpose;
thread_local static char message_buf[1024];

void logToStderr(LogLevel level) { max_level.store((int)level, std::memory_order_relaxed); }

void setThreadPurpose(std::string purpose) { thread_purpose = std::move(purpose); }

static const char *levelName(LogLevel level) {
  switch (level) {
  case LogLevel::Error:
    return "error";
  case LogLevel::Warn:
    return "warn";
  case LogLevel::Info:
    return "info";
  case LogLevel::Debug:
    return "debug";
  }
  return "";
}

void log(LogLevel level, const char *format, ...) {
  if ((int)level > max_level.load(std::memory_order_relaxed)) {
    return;
  }

  std::va_list args;
  va_start(args, format);
  // vsnprintf truncates and always terminates.
  std::vsnprintf(message_buf, sizeof(message_buf), format, args);
  va_end(args);

  const char *purpose = thread_purpose.empty() ? "main" : thread_purpose.c_str();
  std::fprintf(stderr, "tactus[%s] %s: %s\n", purpose, levelName(level), message_buf);
}

} // namespace tactus
