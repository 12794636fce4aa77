#include "domain/geo_filter.h"

#include <algorithm>

#include "utils/geo_utils.h"

namespace nearby {
namespace domain {

GeoFilter::GeoFilter(double radius_m) : radius_m_(radius_m) {}

bool GeoFilter::accepts(double distance_m) const {
  return distance_m <= radius_m_;
}

NearbyFriendList GeoFilter::filter(const NearbyFriendList& candidates,
                                   const Coordinate& center) const {
  NearbyFriendList out;
  out.reserve(candidates.size());
  for (const NearbyFriendResult& candidate : candidates) {
    if (accepts(nearby::distance_m(center, candidate.coordinate))) {
      out.push_back(candidate);
    }
  }
  return out;
}

size_t GeoFilter::filter_in_place(NearbyFriendList* candidates) const {
  if (!candidates) {
    return 0;
  }
  const size_t before = candidates->size();
  candidates->erase(std::remove_if(candidates->begin(),
                                   candidates->end(),
                                   [this](const NearbyFriendResult& c) {
                                     return !accepts(c.distance_m);
                                   }),
                    candidates->end());
  return before - candidates->size();
}

} // namespace domain
} // namespace nearby
