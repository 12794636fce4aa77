/**
 * @file clock.h
 * @brief Platform clock interface for engine timing.
 */
#pragma once

#include <cstdint>

namespace nearby::platform {

/// Wall-clock milliseconds since the Unix epoch. Friend activity timestamps use the same base.
using millis_t = int64_t;

/**
 * @brief Platform clock abstraction.
 */
struct IClock {
  virtual ~IClock() = default;

  /**
   * @brief Return the current wall-clock time in milliseconds.
   */
  virtual millis_t now_ms() const = 0;

  /**
   * @brief Sleep for the specified number of milliseconds.
   */
  virtual void sleep_ms(millis_t duration_ms) const = 0;
};

} // namespace nearby::platform
