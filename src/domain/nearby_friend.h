#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "nearby/hal/interfaces.h"

namespace nearby {
namespace domain {

enum class ProximityBucket : uint8_t {
  VERY_CLOSE = 0,  // < 300 m
  NEARBY = 1,      // 300 m .. < 2 km
  IN_TOWN = 2,     // >= 2 km
  UNKNOWN = 3,     // no user location yet
};

/** Distance reported for friends passed through before the user location resolved. */
constexpr double kUnknownDistanceM = std::numeric_limits<double>::infinity();

struct NearbyFriendResult {
  std::string id;
  std::string display_name;
  Coordinate coordinate;
  double distance_m = kUnknownDistanceM;
  std::string formatted_distance;
  bool is_online = false;
  int64_t last_active_at_ms = 0;
  float rank_score = 1.0f;
  ProximityBucket bucket = ProximityBucket::UNKNOWN;
};

using NearbyFriendList = std::vector<NearbyFriendResult>;

ProximityBucket proximity_bucket(double distance_m);
const char* proximity_bucket_str(ProximityBucket bucket);

/** Rank order: score, then distance, then id. Strict weak ordering. */
bool rank_less(const NearbyFriendResult& a, const NearbyFriendResult& b);

} // namespace domain
} // namespace nearby
