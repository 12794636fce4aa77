#pragma once

#include <cstddef>
#include <cstdint>

#include "domain/nearby_friend.h"
#include "nearby/hal/interfaces.h"

namespace nearby {
namespace domain {

/**
 * Everything the engine remembers between ticks. Owned by exactly one
 * ProximityEngine; moved into recompute() and back out, never shared.
 */
struct EngineState {
  bool has_user_sample = false;
  UserLocationSample last_user_sample{};
  int64_t last_recalculation_at_ms = 0;
  uint64_t last_roster_fingerprint = 0;  // 0 = none
  /** Ascending by (rank_score, distance_m, id); every distance <= radius. */
  NearbyFriendList cached_results;
};

/** Holder for the last computed result and its provenance. Single writer. */
class ResultCache {
 public:
  explicit ResultCache(size_t max_entries);

  const EngineState& state() const { return state_; }
  const NearbyFriendList& results() const { return state_.cached_results; }
  bool has_results() const { return !state_.cached_results.empty(); }
  bool has_user_sample() const { return state_.has_user_sample; }
  size_t max_entries() const { return max_entries_; }

  /** Move the state out for a recomputation; the cache is left empty. */
  EngineState take();
  /** Install a recomputed state. Results beyond max_entries are dropped. */
  void replace(EngineState state);
  void clear();

 private:
  size_t max_entries_;
  EngineState state_{};
};

} // namespace domain
} // namespace nearby
