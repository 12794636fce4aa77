#pragma once

#include <cstdint>

#include "domain/engine_config.h"
#include "domain/result_cache.h"
#include "nearby/hal/interfaces.h"

namespace nearby {
namespace domain {

enum class RecalcReason : uint8_t {
  NONE = 0,
  FIRST_SAMPLE = 1,
  ROSTER_CHANGED = 2,
  TIME_ELAPSED = 3,
  MOVEMENT = 4,
};

struct RecalcDecision {
  RecalcReason reason;
  double displacement_m;
  int64_t elapsed_ms;

  bool recompute() const { return reason != RecalcReason::NONE; }
};

const char* recalc_reason_str(RecalcReason reason);

/**
 * Decides per tick whether a full recomputation is due. Staleness of the
 * cached result is bounded by the time threshold or the movement threshold,
 * whichever is hit first; any roster change recomputes immediately.
 */
class RecalculationPolicy {
 public:
  RecalculationPolicy();
  explicit RecalculationPolicy(const EngineConfig& config);

  RecalcDecision evaluate(const EngineState& state,
                          const UserLocationSample& sample,
                          uint64_t roster_fingerprint,
                          int64_t now_ms) const;

 private:
  int64_t time_threshold_ms_;
  double movement_threshold_m_;
};

} // namespace domain
} // namespace nearby
