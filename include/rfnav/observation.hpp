#pragma once

#include <cstdint>
#include <string>

#include "identity.hpp"

namespace rfnav {

// Signal strength range shared by all emitter types (GSM ASU scale)
constexpr int MINIMUM_SIGNAL = 1;
constexpr int MAXIMUM_SIGNAL = 31;

int clamp_signal(int signal);

// One sighting of one emitter in one scan. Consumed by the worker once.
struct Observation {
    Identity identity;
    int signal = MINIMUM_SIGNAL;     // clamped and device corrected
    int64_t capture_time_ns = 0;     // monotonic clock of the scan
    int64_t time_ms = 0;             // wall clock of the scan
    std::string label;               // SSID for WiFi, empty otherwise
    bool suspicious = false;         // collector does not trust the reading
};

// A trusted position (satellite or smoothed satellite)
struct Fix {
    double lat = 0.0;
    double lon = 0.0;
    float accuracy_m = 0.0f;
    int64_t capture_time_ns = 0;
    int64_t time_ms = 0;
};

} // namespace rfnav
