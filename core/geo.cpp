#include "geo.hpp"

#include <algorithm>
#include <cmath>

namespace rfnav::geo {

static constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;
static constexpr double NULL_ISLAND_DISTANCE_DEG = NULL_ISLAND_DISTANCE * METER_TO_DEG;

double cos_lat(double lat_deg) {
    return std::max(MIN_COS, std::cos(lat_deg * DEG_TO_RAD));
}

double approximate_distance(double lat1, double lon1, double lat2, double lon2) {
    double d_lat = lat1 - lat2;
    double d_lon = (lon1 - lon2) * std::cos(lat1 * DEG_TO_RAD);
    return std::sqrt(d_lat * d_lat + d_lon * d_lon) * DEG_TO_METER;
}

bool not_null_island(double lat, double lon) {
    // cheap test first, distance only for points inside the square
    return std::fabs(lat) > NULL_ISLAND_DISTANCE_DEG
        || std::fabs(lon) > NULL_ISLAND_DISTANCE_DEG
        || approximate_distance(lat, lon, 0.0, 0.0) > NULL_ISLAND_DISTANCE;
}

} // namespace rfnav::geo
