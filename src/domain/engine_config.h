#pragma once

#include <cstddef>
#include <cstdint>

namespace nearby {
namespace domain {

/**
 * Tunables for the proximity engine. Defaults are the standard profile.
 * Weights must be non-negative and sum to 1 so the rank score stays in [0, 1].
 */
struct EngineConfig {
  double geo_filter_radius_m = 10000.0;
  double movement_threshold_m = 20.0;
  int64_t time_threshold_ms = 10000;
  double distance_tolerance_m = 1.0;
  float score_tolerance = 0.01f;
  size_t max_tracked_friends = 1000;

  float proximity_weight = 0.5f;
  float recency_weight = 0.3f;
  float status_weight = 0.2f;
  int64_t recency_window_ms = 24LL * 60 * 60 * 1000;

  /** Recomputations slower than this are logged as SLOW_RECOMPUTE. */
  uint32_t slow_recompute_threshold_ms = 100;
  /** Background worker threads for recomputation. */
  uint32_t worker_threads = 1;
};

constexpr uint32_t kProfileStandard = 0;
constexpr uint32_t kProfileBatterySaver = 1;
constexpr uint32_t kProfileLive = 2;
constexpr uint32_t kMaxProfileId = kProfileLive;

/**
 * Fill config with the built-in profile (0=Standard, 1=BatterySaver, 2=Live).
 * Unknown ids fall back to Standard and return false.
 */
bool get_profile_config(uint32_t profile_id, EngineConfig* out);

const char* profile_name(uint32_t profile_id);

/**
 * Check config invariants. On failure writes a short reason into err (if given)
 * and returns false.
 */
bool validate_engine_config(const EngineConfig& config, char* err, size_t err_size);

} // namespace domain
} // namespace nearby
