#include "characteristics.hpp"

namespace rfnav {

namespace {

constexpr double METERS = 1.0;
constexpr double KM = 1000.0 * METERS;

// 2.4 GHz indoor range is about 46 m, outdoor about 90 m. Very long detection
// distances show up in rural areas, so the move threshold is generous.
const Characteristics k_wlan24{15.0f, 35.0 * METERS, 300.0 * METERS, 2};

// 5 and 6 GHz differ too little in range to model separately
const Characteristics k_wlan5{10.0f, 15.0 * METERS, 100.0 * METERS, 2};

// Class 1 devices reach about 100 m
const Characteristics k_bluetooth{5.0f, 2.0 * METERS, 100.0 * METERS, 2};

// Usual maximum is ~35 km, extended range cells reach ~200 km
const Characteristics k_gsm{100.0f, 500.0 * METERS, 200.0 * KM, 1};

// Macro cells ~35 km. Small cells exist but assuming them everywhere would
// make single-cell reports far too confident.
const Characteristics k_lte{50.0f, 250.0 * METERS, 100.0 * KM, 1};

// Never usable: needs a 2 m fix and a group of 99
const Characteristics k_unknown{2.0f, 50.0 * METERS, 100.0 * METERS, 99};

} // namespace

const Characteristics& characteristics_for(EmitterType type) {
    switch (type) {
        case EmitterType::WLAN2: return k_wlan24;
        case EmitterType::WLAN5:
        case EmitterType::WLAN6: return k_wlan5;
        case EmitterType::BT: return k_bluetooth;
        case EmitterType::GSM: return k_gsm;
        case EmitterType::CDMA:
        case EmitterType::WCDMA:
        case EmitterType::TDSCDMA:
        case EmitterType::LTE:
        case EmitterType::NR: return k_lte;
        case EmitterType::INVALID: break;
    }
    return k_unknown;
}

} // namespace rfnav
