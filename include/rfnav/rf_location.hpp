#pragma once

#include <cstdint>
#include <string>

#include "emitter_type.hpp"

namespace rfnav {

// Point-in-time projection of one emitter's coverage, built for a single
// synthesis pass
struct RfLocation {
    std::string key;
    EmitterType type = EmitterType::INVALID;
    double lat = 0.0;
    double lon = 0.0;
    double radius = 0.0;             // learned coverage radius, may be 0
    double accuracy_estimate = 0.0;  // radius floored at the type's minimum range
    int signal = 1;
    bool suspicious = false;
    int64_t time_ms = 0;
    int64_t capture_time_ns = 0;
    int minimum_group_size = 1;
};

// One fused position estimate
struct FusedLocation {
    double lat = 0.0;
    double lon = 0.0;
    double accuracy_m = 0.0;
    int64_t time_ms = 0;
    int64_t capture_time_ns = 0;
    int source_count = 0;
};

} // namespace rfnav
