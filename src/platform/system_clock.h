/**
 * @file system_clock.h
 * @brief std::chrono-backed platform clock.
 */
#pragma once

#include "nearby/platform/clock.h"

namespace nearby::platform {

/**
 * @brief Wall clock (system_clock since epoch).
 */
class SystemClock final : public IClock {
 public:
  millis_t now_ms() const override;
  void sleep_ms(millis_t duration_ms) const override;
};

} // namespace nearby::platform
