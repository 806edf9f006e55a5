#include "emitter_type.hpp"

namespace rfnav {

const char* to_string(EmitterType type) {
    switch (type) {
        case EmitterType::WLAN2: return "WLAN2";
        case EmitterType::WLAN5: return "WLAN5";
        case EmitterType::WLAN6: return "WLAN6";
        case EmitterType::BT: return "BT";
        case EmitterType::GSM: return "GSM";
        case EmitterType::CDMA: return "CDMA";
        case EmitterType::WCDMA: return "WCDMA";
        case EmitterType::TDSCDMA: return "TDSCDMA";
        case EmitterType::LTE: return "LTE";
        case EmitterType::NR: return "NR";
        case EmitterType::INVALID: break;
    }
    return "INVALID";
}

EmitterType emitter_type_from_string(const std::string& name) {
    static const EmitterType all[] = {
        EmitterType::WLAN2, EmitterType::WLAN5, EmitterType::WLAN6, EmitterType::BT,
        EmitterType::GSM, EmitterType::CDMA, EmitterType::WCDMA, EmitterType::TDSCDMA,
        EmitterType::LTE, EmitterType::NR
    };
    for (EmitterType t : all) {
        if (name == to_string(t)) return t;
    }
    return EmitterType::INVALID;
}

bool is_wlan(EmitterType type) {
    return type == EmitterType::WLAN2 || type == EmitterType::WLAN5 || type == EmitterType::WLAN6;
}

bool is_short_range(EmitterType type) {
    return is_wlan(type) || type == EmitterType::BT;
}

} // namespace rfnav
