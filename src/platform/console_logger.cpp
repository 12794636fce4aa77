/**
 * @file console_logger.cpp
 * @brief stderr-backed logger implementation.
 */
#include "platform/console_logger.h"

#include <cstdio>

namespace nearby::platform {

const char* log_level_str(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo: return "INFO";
    case LogLevel::kWarn: return "WARN";
    case LogLevel::kError: return "ERROR";
    default: return "?";
  }
}

void ConsoleLogger::log(LogLevel level, const char* tag, const char* msg) {
  if (!msg || level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::fprintf(stderr, "[%s] %s: %s\n", log_level_str(level), tag ? tag : "-", msg);
}

} // namespace nearby::platform
