#include "position_synthesis.hpp"

#include "rfnav/geo.hpp"
#include "rfnav/log.hpp"

#include <algorithm>

namespace rfnav::fusion {

static const char* TAG = "cull";

namespace {

bool compatible(const RfLocation& a, const RfLocation& b, const SynthesisConfig& cfg) {
    return geo::approximate_distance(a.lat, a.lon, b.lat, b.lon)
        <= cfg.group_distance_factor * (a.accuracy_estimate + b.accuracy_estimate);
}

// Every location seeds a group; every other location joins a group when it is
// compatible with all members already in it. Groups may overlap.
std::vector<std::vector<size_t>> divide_in_groups(const std::vector<RfLocation>& in,
                                                  const SynthesisConfig& cfg) {
    std::vector<std::vector<size_t>> groups(in.size());
    for (size_t g = 0; g < in.size(); ++g) groups[g].push_back(g);
    for (size_t i = 0; i < in.size(); ++i) {
        for (size_t g = 0; g < groups.size(); ++g) {
            auto& group = groups[g];
            if (std::find(group.begin(), group.end(), i) != group.end()) continue;
            bool fits = std::all_of(group.begin(), group.end(),
                                    [&](size_t m) { return compatible(in[i], in[m], cfg); });
            if (fits) group.push_back(i);
        }
    }
    return groups;
}

} // namespace

bool cull(const std::vector<RfLocation>& in, std::vector<RfLocation>& out, const SynthesisConfig& cfg) {
    out.clear();
    if (in.empty()) return false;
    if (in.size() == 1) {
        if (in.front().type == EmitterType::INVALID) return false;
        out = in;
        return true;
    }

    auto groups = divide_in_groups(in, cfg);
    size_t best = 0;
    for (size_t g = 1; g < groups.size(); ++g) {
        if (groups[g].size() > groups[best].size()) best = g;
    }
    const auto& winner = groups[best];
    bool enough = std::any_of(winner.begin(), winner.end(), [&](size_t m) {
        return (int)winner.size() >= in[m].minimum_group_size;
    });
    if (!enough) {
        log::debug(TAG, "largest group has " + std::to_string(winner.size()) + " of "
                            + std::to_string(in.size()) + ", below every minimum group size");
        return false;
    }
    for (size_t m : winner) out.push_back(in[m]);
    return true;
}

} // namespace rfnav::fusion
