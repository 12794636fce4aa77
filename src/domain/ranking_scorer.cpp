#include "domain/ranking_scorer.h"

#include <cmath>

namespace nearby {
namespace domain {

SmartRankingScorer::SmartRankingScorer() : SmartRankingScorer(EngineConfig{}) {}

SmartRankingScorer::SmartRankingScorer(const EngineConfig& config)
    : radius_m_(config.geo_filter_radius_m),
      recency_window_ms_(config.recency_window_ms),
      proximity_weight_(config.proximity_weight),
      recency_weight_(config.recency_weight),
      status_weight_(config.status_weight) {}

float SmartRankingScorer::score(double distance_m,
                                int64_t last_active_at_ms,
                                bool is_online,
                                int64_t now_ms) const {
  return proximity_subscore(distance_m) * proximity_weight_ +
         recency_subscore(last_active_at_ms, now_ms) * recency_weight_ +
         status_subscore(is_online) * status_weight_;
}

float SmartRankingScorer::proximity_subscore(double distance_m) const {
  if (!(distance_m >= 0.0) || !std::isfinite(distance_m) || radius_m_ <= 0.0) {
    return 1.0f;
  }
  const double ratio = distance_m / radius_m_;
  return static_cast<float>(ratio < 1.0 ? ratio : 1.0);
}

float SmartRankingScorer::recency_subscore(int64_t last_active_at_ms, int64_t now_ms) const {
  if (recency_window_ms_ <= 0) {
    return 1.0f;
  }
  const int64_t age_ms = now_ms - last_active_at_ms;
  if (age_ms <= 0) {
    return 0.0f;
  }
  const double ratio = static_cast<double>(age_ms) / static_cast<double>(recency_window_ms_);
  return static_cast<float>(ratio < 1.0 ? ratio : 1.0);
}

float SmartRankingScorer::status_subscore(bool is_online) {
  return is_online ? 0.0f : 1.0f;
}

} // namespace domain
} // namespace nearby
