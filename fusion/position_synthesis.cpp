#include "position_synthesis.hpp"

#include "rfnav/geo.hpp"
#include "rfnav/log.hpp"

namespace rfnav::fusion {

static const char* TAG = "synthesis";

bool synthesize(const std::vector<RfLocation>& in, CullMode mode, FusedLocation& out, const SynthesisConfig& cfg) {
    if (in.empty()) return false;

    FusedLocation result;
    bool ok = false;
    switch (mode) {
        case CullMode::None:
            ok = weighted_average(in, result, cfg);
            break;
        case CullMode::Cluster: {
            std::vector<RfLocation> group;
            ok = cull(in, group, cfg) && weighted_average(group, result, cfg);
            break;
        }
        case CullMode::MedianSafe: {
            std::vector<RfLocation> group;
            ok = cull(in, group, cfg) && median_cull_safe(in, result, cfg);
            break;
        }
    }
    if (!ok) return false;
    if (!geo::not_null_island(result.lat, result.lon)) {
        log::warn(TAG, "fused location at null island dropped");
        return false;
    }
    log::verbose(TAG, "fused " + std::to_string(result.source_count) + " of " + std::to_string(in.size())
                          + " emitters, accuracy " + std::to_string(result.accuracy_m) + " m");
    out = result;
    return true;
}

} // namespace rfnav::fusion
