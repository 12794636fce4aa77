/**
 * @file log.h
 * @brief Text log sink for engine and service messages.
 */
#pragma once

#include <cstdint>

namespace nearby::platform {

/**
 * @brief Ordered from chattiest to most severe; sinks drop lines below their threshold.
 */
enum class LogLevel : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

/**
 * @brief Receives human-readable lines. Calls may arrive from any thread
 * running the io_context, so a shared sink serializes internally.
 */
struct ILogger {
  virtual ~ILogger() = default;

  /**
   * @brief Write one line.
   * @param tag Emitting component, e.g. "nearby" or "app".
   * @param msg Formatted line without a trailing newline; not retained after the call.
   */
  virtual void log(LogLevel level, const char* tag, const char* msg) = 0;
};

} // namespace nearby::platform
