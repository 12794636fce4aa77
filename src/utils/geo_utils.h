#pragma once

#include <cstdint>
#include <string>

#include "nearby/hal/interfaces.h"

namespace nearby {

constexpr double kEarthRadiusM = 6371000.0;
constexpr double kPi = 3.14159265358979323846;

double deg_to_rad(double deg);
double rad_to_deg(double rad);

/** Great-circle (haversine) distance in meters. Symmetric; NaN/inf inputs yield NaN. */
double distance_m(const Coordinate& a, const Coordinate& b);

/** Finite latitude in [-90, 90] and longitude in [-180, 180]. */
bool is_valid_coordinate(const Coordinate& c);

/** Move a coordinate by local east/north offsets in meters (small-distance approximation). */
Coordinate offset_m(const Coordinate& from, double east_m, double north_m);

/**
 * Display form of a distance: "<n> m" below 1000 m (rounded to integer),
 * "<n.n> km" otherwise. Non-finite distances format as an empty string.
 */
std::string format_distance(double distance_m);

/** Numerical Recipes LCG step; advances state and returns it. Used by the simulated sources. */
uint32_t lcg_next(uint32_t& state);

} // namespace nearby
