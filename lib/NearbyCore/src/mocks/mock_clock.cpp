#include "nearby/hal/mocks/mock_clock.h"

namespace nearby {

MockClock::MockClock(platform::millis_t start_ms) : now_ms_(start_ms) {}

platform::millis_t MockClock::now_ms() const {
  return now_ms_.load();
}

void MockClock::sleep_ms(platform::millis_t duration_ms) const {
  if (duration_ms > 0) {
    now_ms_.fetch_add(duration_ms);
  }
}

void MockClock::set_ms(platform::millis_t now_ms) {
  now_ms_.store(now_ms);
}

void MockClock::advance_ms(platform::millis_t delta_ms) {
  now_ms_.fetch_add(delta_ms);
}

} // namespace nearby
