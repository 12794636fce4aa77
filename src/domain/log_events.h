#pragma once

#include <cstdint>

namespace nearby {
namespace domain {

enum class LogEventId : uint16_t {
  SUBSCRIBE = 0x0101,
  UNSUBSCRIBE = 0x0102,
  RECOMPUTE = 0x0201,
  RECOMPUTE_SKIPPED = 0x0202,
  SLOW_RECOMPUTE = 0x0203,
  ROSTER_CAPPED = 0x0204,
  ENTRY_SKIPPED = 0x0205,
  DEGRADED_PASS_THROUGH = 0x0206,
  EMIT = 0x0301,
  EMIT_SUPPRESSED = 0x0302,
  LOCATION_SOURCE_ERR = 0x0401,
  ROSTER_SOURCE_ERR = 0x0402,
};

} // namespace domain
} // namespace nearby
