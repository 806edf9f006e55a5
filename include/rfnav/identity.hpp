#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <string>

#include "emitter_type.hpp"

namespace rfnav {

// Complete identification of one emitter: an id unique within its type, and
// the type. The unique key is what the cache and the store index by.
class Identity {
public:
    Identity() : type_(EmitterType::INVALID) {}
    Identity(std::string id, EmitterType type);

    const std::string& id() const { return id_; }
    EmitterType type() const { return type_; }
    const std::string& key() const { return key_; }

    bool operator==(const Identity& o) const { return key_ == o.key_; }
    bool operator!=(const Identity& o) const { return key_ != o.key_; }
    bool operator<(const Identity& o) const { return key_ < o.key_; }

private:
    std::string id_;
    EmitterType type_;
    std::string key_;
};

// Lower case, '.' separators mapped to ':'
std::string normalize_bssid(const std::string& bssid);

// Band from channel center frequency. 5945 MHz is both WLAN5 and WLAN6 and
// is treated as WLAN5.
EmitterType wlan_type_for_frequency(int frequency_mhz);

// Raw cell identity as reported by the modem; CELL_UNKNOWN marks missing fields
struct CellInfo {
    static constexpr int32_t CELL_UNKNOWN = std::numeric_limits<int32_t>::max();

    EmitterType type = EmitterType::INVALID;
    int32_t mcc = CELL_UNKNOWN;
    int32_t mnc = CELL_UNKNOWN;
    int32_t area = CELL_UNKNOWN;   // LAC or TAC
    int32_t cell = CELL_UNKNOWN;   // CID / CI / NCI
    int32_t pci = CELL_UNKNOWN;    // LTE only
    // CDMA
    int32_t network_id = CELL_UNKNOWN;
    int32_t system_id = CELL_UNKNOWN;
    int32_t basestation_id = CELL_UNKNOWN;
};

// Builds "<TYPE>/<fields...>" ids. Returns false for incomplete cells, which
// callers drop before they become observations.
bool identity_from_cell(const CellInfo& cell, Identity& out);

} // namespace rfnav

namespace std {
template <>
struct hash<rfnav::Identity> {
    size_t operator()(const rfnav::Identity& id) const { return hash<string>()(id.key()); }
};
} // namespace std
