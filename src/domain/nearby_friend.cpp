#include "domain/nearby_friend.h"

#include <cmath>

namespace nearby {
namespace domain {

namespace {

constexpr double kVeryCloseThresholdM = 300.0;
constexpr double kNearbyThresholdM = 2000.0;

} // namespace

ProximityBucket proximity_bucket(double distance_m) {
  if (!std::isfinite(distance_m)) {
    return ProximityBucket::UNKNOWN;
  }
  if (distance_m < kVeryCloseThresholdM) {
    return ProximityBucket::VERY_CLOSE;
  }
  if (distance_m < kNearbyThresholdM) {
    return ProximityBucket::NEARBY;
  }
  return ProximityBucket::IN_TOWN;
}

const char* proximity_bucket_str(ProximityBucket bucket) {
  switch (bucket) {
    case ProximityBucket::VERY_CLOSE: return "VERY_CLOSE";
    case ProximityBucket::NEARBY: return "NEARBY";
    case ProximityBucket::IN_TOWN: return "IN_TOWN";
    case ProximityBucket::UNKNOWN: return "UNKNOWN";
  }
  return "?";
}

bool rank_less(const NearbyFriendResult& a, const NearbyFriendResult& b) {
  if (a.rank_score != b.rank_score) {
    return a.rank_score < b.rank_score;
  }
  if (a.distance_m != b.distance_m) {
    return a.distance_m < b.distance_m;
  }
  return a.id < b.id;
}

} // namespace domain
} // namespace nearby
