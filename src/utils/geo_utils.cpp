#include "utils/geo_utils.h"

#include <cmath>
#include <cstdio>

namespace nearby {

namespace {

double hav(double angle_rad) {
  const double s = std::sin(angle_rad * 0.5);
  return s * s;
}

} // namespace

double deg_to_rad(double deg) {
  return deg * kPi / 180.0;
}

double rad_to_deg(double rad) {
  return rad * 180.0 / kPi;
}

uint32_t lcg_next(uint32_t& state) {
  state = state * 1664525u + 1013904223u;
  return state;
}

double distance_m(const Coordinate& a, const Coordinate& b) {
  const double lat1 = deg_to_rad(a.latitude);
  const double lat2 = deg_to_rad(b.latitude);
  const double d_lat = lat2 - lat1;
  const double d_lon = deg_to_rad(b.longitude - a.longitude);

  double h = hav(d_lat) + std::cos(lat1) * std::cos(lat2) * hav(d_lon);
  // Rounding can push h a hair outside [0, 1] for antipodal or identical points.
  if (h > 1.0) {
    h = 1.0;
  } else if (h < 0.0) {
    h = 0.0;
  }
  return 2.0 * kEarthRadiusM * std::asin(std::sqrt(h));
}

bool is_valid_coordinate(const Coordinate& c) {
  if (!std::isfinite(c.latitude) || !std::isfinite(c.longitude)) {
    return false;
  }
  return c.latitude >= -90.0 && c.latitude <= 90.0 &&
         c.longitude >= -180.0 && c.longitude <= 180.0;
}

Coordinate offset_m(const Coordinate& from, double east_m, double north_m) {
  const double lat_rad = deg_to_rad(from.latitude);
  const double d_lat = north_m / kEarthRadiusM;
  const double d_lon = east_m / (kEarthRadiusM * std::cos(lat_rad));

  Coordinate out;
  out.latitude = from.latitude + rad_to_deg(d_lat);
  out.longitude = from.longitude + rad_to_deg(d_lon);
  return out;
}

std::string format_distance(double distance_m) {
  if (!std::isfinite(distance_m)) {
    return std::string();
  }
  char buffer[32] = {0};
  if (distance_m < 1000.0) {
    std::snprintf(buffer, sizeof(buffer), "%ld m", std::lround(distance_m));
  } else {
    std::snprintf(buffer, sizeof(buffer), "%.1f km", distance_m / 1000.0);
  }
  return std::string(buffer);
}

} // namespace nearby
