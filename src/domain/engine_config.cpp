#include "domain/engine_config.h"

#include <cmath>
#include <cstdio>

namespace nearby {
namespace domain {

namespace {

constexpr float kWeightSumTolerance = 1e-3f;
constexpr size_t kMaxTrackedFriendsLimit = 100000;
constexpr uint32_t kMaxWorkerThreads = 16;

bool config_error(char* err, size_t err_size, const char* reason) {
  if (err && err_size > 0) {
    std::snprintf(err, err_size, "%s", reason);
  }
  return false;
}

} // namespace

bool get_profile_config(uint32_t profile_id, EngineConfig* out) {
  if (!out) return false;
  *out = EngineConfig{};
  switch (profile_id) {
    case kProfileStandard:
      return true;
    case kProfileBatterySaver:
      out->time_threshold_ms = 30000;
      out->movement_threshold_m = 50.0;
      return true;
    case kProfileLive:
      out->time_threshold_ms = 5000;
      out->movement_threshold_m = 10.0;
      return true;
    default:
      return false;
  }
}

const char* profile_name(uint32_t profile_id) {
  switch (profile_id) {
    case kProfileStandard: return "standard";
    case kProfileBatterySaver: return "battery_saver";
    case kProfileLive: return "live";
    default: return "?";
  }
}

bool validate_engine_config(const EngineConfig& config, char* err, size_t err_size) {
  if (!(config.geo_filter_radius_m > 0.0) || !std::isfinite(config.geo_filter_radius_m)) {
    return config_error(err, err_size, "radius_m must be > 0");
  }
  if (!(config.movement_threshold_m >= 0.0) || !std::isfinite(config.movement_threshold_m)) {
    return config_error(err, err_size, "movement_m must be >= 0");
  }
  if (config.time_threshold_ms <= 0) {
    return config_error(err, err_size, "time_ms must be > 0");
  }
  if (!(config.distance_tolerance_m >= 0.0) || !(config.score_tolerance >= 0.0f)) {
    return config_error(err, err_size, "tolerances must be >= 0");
  }
  if (config.max_tracked_friends == 0 || config.max_tracked_friends > kMaxTrackedFriendsLimit) {
    return config_error(err, err_size, "max_friends 1-100000");
  }
  if (config.proximity_weight < 0.0f || config.recency_weight < 0.0f || config.status_weight < 0.0f) {
    return config_error(err, err_size, "weights must be >= 0");
  }
  const float sum = config.proximity_weight + config.recency_weight + config.status_weight;
  if (std::fabs(sum - 1.0f) > kWeightSumTolerance) {
    return config_error(err, err_size, "weights must sum to 1");
  }
  if (config.recency_window_ms <= 0) {
    return config_error(err, err_size, "recency_window_ms must be > 0");
  }
  if (config.worker_threads == 0 || config.worker_threads > kMaxWorkerThreads) {
    return config_error(err, err_size, "workers 1-16");
  }
  return true;
}

} // namespace domain
} // namespace nearby
