/**
 * @file system_clock.cpp
 * @brief std::chrono-backed platform clock.
 */
#include "platform/system_clock.h"

#include <chrono>
#include <thread>

namespace nearby::platform {

millis_t SystemClock::now_ms() const {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count();
}

void SystemClock::sleep_ms(millis_t duration_ms) const {
  if (duration_ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(duration_ms));
  }
}

} // namespace nearby::platform
