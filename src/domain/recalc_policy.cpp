#include "domain/recalc_policy.h"

#include "utils/geo_utils.h"

namespace nearby {
namespace domain {

const char* recalc_reason_str(RecalcReason reason) {
  switch (reason) {
    case RecalcReason::NONE: return "none";
    case RecalcReason::FIRST_SAMPLE: return "first_sample";
    case RecalcReason::ROSTER_CHANGED: return "roster_changed";
    case RecalcReason::TIME_ELAPSED: return "time_elapsed";
    case RecalcReason::MOVEMENT: return "movement";
  }
  return "?";
}

RecalculationPolicy::RecalculationPolicy() : RecalculationPolicy(EngineConfig{}) {}

RecalculationPolicy::RecalculationPolicy(const EngineConfig& config)
    : time_threshold_ms_(config.time_threshold_ms),
      movement_threshold_m_(config.movement_threshold_m) {}

RecalcDecision RecalculationPolicy::evaluate(const EngineState& state,
                                             const UserLocationSample& sample,
                                             uint64_t roster_fingerprint,
                                             int64_t now_ms) const {
  if (!state.has_user_sample) {
    return {RecalcReason::FIRST_SAMPLE, 0.0, 0};
  }

  const int64_t elapsed_ms = now_ms - state.last_recalculation_at_ms;
  const double displacement_m =
      distance_m(state.last_user_sample.coordinate, sample.coordinate);

  if (roster_fingerprint != state.last_roster_fingerprint) {
    return {RecalcReason::ROSTER_CHANGED, displacement_m, elapsed_ms};
  }
  if (elapsed_ms > time_threshold_ms_) {
    return {RecalcReason::TIME_ELAPSED, displacement_m, elapsed_ms};
  }
  // A NaN displacement (corrupt sample) never forces a recompute on its own.
  if (displacement_m > movement_threshold_m_) {
    return {RecalcReason::MOVEMENT, displacement_m, elapsed_ms};
  }
  return {RecalcReason::NONE, displacement_m, elapsed_ms};
}

} // namespace domain
} // namespace nearby
