#pragma once

#include <cstddef>

#include "domain/nearby_friend.h"
#include "nearby/hal/interfaces.h"

namespace nearby {
namespace domain {

constexpr double kDefaultGeoFilterRadiusM = 10000.0;

/** Keeps candidates whose distance to the center is <= radius. Order preserving. */
class GeoFilter {
 public:
  explicit GeoFilter(double radius_m = kDefaultGeoFilterRadiusM);

  double radius_m() const { return radius_m_; }

  /** NaN distances are rejected. */
  bool accepts(double distance_m) const;

  /** Recomputes each candidate's distance to center; input is not modified. */
  NearbyFriendList filter(const NearbyFriendList& candidates, const Coordinate& center) const;

  /** Filter by the distance already stored on each entry. Returns the number removed. */
  size_t filter_in_place(NearbyFriendList* candidates) const;

 private:
  double radius_m_;
};

} // namespace domain
} // namespace nearby
