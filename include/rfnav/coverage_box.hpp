#pragma once

#include <string>

namespace rfnav {

// Smallest lat/lon rectangle holding every position an emitter was seen from.
// Exposed as a center plus north-south and east-west radii in meters. The
// extents only ever grow.
class CoverageBox {
public:
    // Empty: impossible extents, the first update() always expands
    CoverageBox();
    // Single point
    CoverageBox(double lat, double lon);
    // Saved center and radii. Negative radii leave the box empty.
    CoverageBox(double lat, double lon, double radius_ns, double radius_ew);

    // Include a point. Returns whether the box changed.
    bool update(double lat, double lon);

    // Strictly inside
    bool contains(double lat, double lon) const;

    bool empty() const { return north_ < south_; }

    double center_lat() const { return center_lat_; }
    double center_lon() const { return center_lon_; }
    double radius_ns() const { return radius_ns_; }
    double radius_ew() const { return radius_ew_; }
    double radius() const { return radius_; }

    double north() const { return north_; }
    double south() const { return south_; }
    double east() const { return east_; }
    double west() const { return west_; }

    std::string to_string() const;

    bool operator==(const CoverageBox& o) const;

private:
    double center_lat_ = 0.0;
    double center_lon_ = 0.0;
    double radius_ns_ = 0.0;
    double radius_ew_ = 0.0;
    double radius_ = 0.0;

    double north_ = -91.0; // impossibly south
    double south_ = 91.0;  // impossibly north
    double east_ = -181.0; // impossibly west
    double west_ = 181.0;  // impossibly east
};

} // namespace rfnav
