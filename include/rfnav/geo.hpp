#pragma once

namespace rfnav::geo {

// Only approximate: latitude degrees are ~110500 m at the equator and ~111700 m
// at the poles, longitude at the equator ~111300 m. 1% error is fine here.
constexpr double DEG_TO_METER = 111225.0;
constexpr double METER_TO_DEG = 1.0 / DEG_TO_METER;

// Floor for cosines we divide by or scale with
constexpr double MIN_COS = 0.01;

constexpr double NULL_ISLAND_DISTANCE = 1000.0; // meters

// cos(latitude) floored at MIN_COS
double cos_lat(double lat_deg);

// Planar approximation, within 0.1% of the great circle below ~1 degree
double approximate_distance(double lat1, double lon1, double lat2, double lon2);

// True if the point is further than NULL_ISLAND_DISTANCE from (0,0)
bool not_null_island(double lat, double lon);

} // namespace rfnav::geo
