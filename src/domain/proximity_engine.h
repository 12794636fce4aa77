#pragma once

#include <cstddef>
#include <cstdint>

#include "domain/change_detector.h"
#include "domain/engine_config.h"
#include "domain/geo_filter.h"
#include "domain/nearby_friend.h"
#include "domain/ranking_scorer.h"
#include "domain/recalc_policy.h"
#include "domain/result_cache.h"
#include "nearby/hal/interfaces.h"

namespace nearby {
namespace domain {

/** Which branch a tick took. */
enum class TickPath : uint8_t {
  RECOMPUTED = 0,
  CACHE_REUSED = 1,
  DEGRADED_CACHED = 2,        ///< No user location; served the last ranked result.
  DEGRADED_PASS_THROUGH = 3,  ///< No user location and nothing cached; unranked roster.
};

const char* tick_path_str(TickPath path);

struct RecomputeReport {
  size_t input_count = 0;       ///< Roster size as delivered.
  size_t considered_count = 0;  ///< After the MAX_TRACKED_FRIENDS cap.
  bool capped = false;
  size_t no_coordinate_count = 0;
  size_t malformed_count = 0;   ///< Entries skipped for a bad coordinate or distance.
  size_t filtered_out_count = 0;
  size_t bucket_counts[4] = {0, 0, 0, 0};  ///< Indexed by ProximityBucket.
};

struct RecomputeResult {
  EngineState state;
  RecomputeReport report;
};

/**
 * Pure recomputation: cap, distance, geo filter, score, sort. Takes the
 * previous state by value and returns the next one; nothing else is touched.
 * Entries with a malformed coordinate are skipped individually.
 */
RecomputeResult recompute(EngineState state,
                          const Roster& roster,
                          const UserLocationSample& sample,
                          uint64_t roster_fingerprint,
                          int64_t now_ms,
                          const EngineConfig& config);

/**
 * Degraded mode: friends with a usable coordinate, in roster order, with an
 * undefined distance. Capped like recompute().
 */
NearbyFriendList pass_through(const Roster& roster,
                              int64_t now_ms,
                              const EngineConfig& config,
                              RecomputeReport* report);

struct TickOutcome {
  TickPath path = TickPath::CACHE_REUSED;
  RecalcDecision decision{RecalcReason::NONE, 0.0, 0};
  RecomputeReport report{};  ///< Filled only when the roster was walked this tick.
  bool emit = false;
  /** Candidate result; owned by the engine and valid until the next tick or reset(). */
  const NearbyFriendList* results = nullptr;
};

/**
 * One tick of the nearby-friends pipeline. Not thread-safe: the owner must
 * serialize calls (ProximityService hands the engine to one worker at a time).
 */
class ProximityEngine {
 public:
  ProximityEngine();
  explicit ProximityEngine(const EngineConfig& config);

  /** sample == nullptr means the user location has not resolved yet. */
  TickOutcome on_tick(const Roster& roster, const UserLocationSample* sample, int64_t now_ms);

  const EngineConfig& config() const { return config_; }
  const ResultCache& cache() const { return cache_; }
  const ChangeDetector& change_detector() const { return change_detector_; }
  uint32_t recompute_count() const { return recompute_count_; }

  /** Drop all state, including the last emission. */
  void reset();

 private:
  EngineConfig config_;
  RecalculationPolicy policy_;
  ChangeDetector change_detector_;
  ResultCache cache_;
  NearbyFriendList pass_through_;
  uint32_t recompute_count_ = 0;
};

} // namespace domain
} // namespace nearby
