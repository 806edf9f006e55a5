#pragma once

#include <string>

namespace rfnav {

enum class EmitterType {
    WLAN2,
    WLAN5,
    WLAN6,
    BT,
    GSM,
    CDMA,
    WCDMA,
    TDSCDMA,
    LTE,
    NR,
    INVALID
};

// Stable text names, used in persistence, settings and traces
const char* to_string(EmitterType type);

// Unknown names map to INVALID
EmitterType emitter_type_from_string(const std::string& name);

// WiFi and Bluetooth: short range, label-checked, keyed with a type prefix
bool is_short_range(EmitterType type);
bool is_wlan(EmitterType type);

} // namespace rfnav
