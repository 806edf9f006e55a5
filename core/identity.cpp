#include "identity.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace rfnav {

Identity::Identity(std::string id, EmitterType type)
    : id_(std::move(id)), type_(type) {
    // Same address on two bands is two emitters; cell ids already carry their type
    if (is_short_range(type_) || type_ == EmitterType::INVALID) {
        key_ = std::string(to_string(type_)) + ":" + id_;
    } else {
        key_ = id_;
    }
}

std::string normalize_bssid(const std::string& bssid) {
    std::string out = bssid;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return c == '.' ? ':' : (char)std::tolower(c);
    });
    return out;
}

EmitterType wlan_type_for_frequency(int frequency_mhz) {
    if (frequency_mhz < 3000) return EmitterType::WLAN2;  // 2401 - 2495
    if (frequency_mhz <= 5945) return EmitterType::WLAN5; // 5030 - 5945
    if (frequency_mhz > 6000) return EmitterType::WLAN6;  // up to 7125
    // overlap: 6 GHz channel centers end in 5
    if (frequency_mhz % 10 == 5) return EmitterType::WLAN6;
    return EmitterType::WLAN5;
}

static bool known(int32_t v) { return v != CellInfo::CELL_UNKNOWN; }

bool identity_from_cell(const CellInfo& c, Identity& out) {
    const std::string prefix = to_string(c.type);
    switch (c.type) {
        case EmitterType::LTE:
            if (!known(c.mcc) || !known(c.mnc)) return false;
            if (!known(c.cell) || !known(c.pci) || !known(c.area)) return false;
            out = Identity(prefix + "/" + std::to_string(c.mcc) + "/" + std::to_string(c.mnc) + "/" +
                               std::to_string(c.cell) + "/" + std::to_string(c.pci) + "/" +
                               std::to_string(c.area),
                           c.type);
            return true;
        case EmitterType::GSM:
        case EmitterType::WCDMA:
        case EmitterType::TDSCDMA:
        case EmitterType::NR:
            if (!known(c.mcc) || !known(c.mnc)) return false;
            // LAC 0 shows up often and is never valid
            if (!known(c.area) || c.area == 0 || !known(c.cell)) return false;
            out = Identity(prefix + "/" + std::to_string(c.mcc) + "/" + std::to_string(c.mnc) + "/" +
                               std::to_string(c.area) + "/" + std::to_string(c.cell),
                           c.type);
            return true;
        case EmitterType::CDMA:
            if (!known(c.network_id) || !known(c.system_id) || !known(c.basestation_id)) return false;
            out = Identity(prefix + "/" + std::to_string(c.network_id) + "/" +
                               std::to_string(c.system_id) + "/" + std::to_string(c.basestation_id),
                           c.type);
            return true;
        default:
            return false;
    }
}

} // namespace rfnav
