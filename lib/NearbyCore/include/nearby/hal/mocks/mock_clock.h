#pragma once

#include <atomic>

#include "nearby/platform/clock.h"

namespace nearby {

/// Manually driven clock. sleep_ms advances time instead of blocking.
class MockClock : public platform::IClock {
 public:
  explicit MockClock(platform::millis_t start_ms = 0);

  platform::millis_t now_ms() const override;
  void sleep_ms(platform::millis_t duration_ms) const override;

  void set_ms(platform::millis_t now_ms);
  void advance_ms(platform::millis_t delta_ms);

 private:
  mutable std::atomic<platform::millis_t> now_ms_;
};

} // namespace nearby
