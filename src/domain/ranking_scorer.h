#pragma once

#include <cstdint>

#include "domain/engine_config.h"

namespace nearby {
namespace domain {

/**
 * Blended ascending-priority score: lower ranks higher.
 *
 *   score = proximity * w_p + recency * w_r + status * w_s
 *
 * proximity = min(distance / radius, 1), recency = min(age / window, 1),
 * status = 0 online / 1 offline. Each sub-score is in [0, 1], so with weights
 * summing to 1 the score is in [0, 1]. Non-finite distances count as the
 * farthest possible proximity.
 */
class SmartRankingScorer {
 public:
  SmartRankingScorer();
  explicit SmartRankingScorer(const EngineConfig& config);

  float score(double distance_m, int64_t last_active_at_ms, bool is_online, int64_t now_ms) const;

  float proximity_subscore(double distance_m) const;
  float recency_subscore(int64_t last_active_at_ms, int64_t now_ms) const;
  static float status_subscore(bool is_online);

 private:
  double radius_m_;
  int64_t recency_window_ms_;
  float proximity_weight_;
  float recency_weight_;
  float status_weight_;
};

} // namespace domain
} // namespace nearby
