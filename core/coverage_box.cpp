#include "coverage_box.hpp"
#include "geo.hpp"

#include <cmath>
#include <cstdio>

namespace rfnav {

CoverageBox::CoverageBox() {}

CoverageBox::CoverageBox(double lat, double lon) {
    update(lat, lon);
}

CoverageBox::CoverageBox(double lat, double lon, double radius_ns, double radius_ew) {
    if (radius_ns < 0.0 || radius_ew < 0.0) return;
    center_lat_ = lat;
    center_lon_ = lon;
    radius_ns_ = radius_ns;
    radius_ew_ = radius_ew;
    radius_ = std::sqrt(radius_ns_ * radius_ns_ + radius_ew_ * radius_ew_);

    north_ = center_lat_ + radius_ns_ * geo::METER_TO_DEG;
    south_ = center_lat_ - radius_ns_ * geo::METER_TO_DEG;
    const double cos_lat = geo::cos_lat(center_lat_);
    east_ = center_lon_ + radius_ew_ * geo::METER_TO_DEG / cos_lat;
    west_ = center_lon_ - radius_ew_ * geo::METER_TO_DEG / cos_lat;
}

bool CoverageBox::update(double lat, double lon) {
    bool updated = false;
    if (lat > north_) { north_ = lat; updated = true; }
    if (lat < south_) { south_ = lat; updated = true; }
    if (lon > east_) { east_ = lon; updated = true; }
    if (lon < west_) { west_ = lon; updated = true; }
    if (!updated) return false;

    center_lat_ = (north_ + south_) / 2.0;
    center_lon_ = (east_ + west_) / 2.0;
    radius_ns_ = (north_ - center_lat_) * geo::DEG_TO_METER;
    radius_ew_ = (east_ - center_lon_) * geo::DEG_TO_METER * geo::cos_lat(center_lat_);
    radius_ = std::sqrt(radius_ns_ * radius_ns_ + radius_ew_ * radius_ew_);
    return true;
}

bool CoverageBox::contains(double lat, double lon) const {
    return north_ > lat && south_ < lat && east_ > lon && west_ < lon;
}

std::string CoverageBox::to_string() const {
    char buf[192];
    std::snprintf(buf, sizeof(buf), "(N %.6f W %.6f S %.6f E %.6f, c %.6f,%.6f, r %.1f/%.1f/%.1f)",
                  north_, west_, south_, east_, center_lat_, center_lon_, radius_ns_, radius_ew_, radius_);
    return std::string(buf);
}

bool CoverageBox::operator==(const CoverageBox& o) const {
    return center_lat_ == o.center_lat_ && center_lon_ == o.center_lon_
        && radius_ns_ == o.radius_ns_ && radius_ew_ == o.radius_ew_;
}

} // namespace rfnav
