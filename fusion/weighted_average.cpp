#include "position_synthesis.hpp"

#include "rfnav/characteristics.hpp"
#include "rfnav/geo.hpp"
#include "rfnav/observation.hpp"

#include <algorithm>
#include <cmath>

namespace rfnav::fusion {

namespace {

struct Member {
    double lat;
    double lon;
    double weight;
    double sigma_m; // one sigma, meters
};

// Suspicious readings count half
int effective_signal(const RfLocation& loc) {
    int s = clamp_signal(loc.signal);
    return loc.suspicious ? std::max(MINIMUM_SIGNAL, s / 2) : s;
}

Member make_member(const RfLocation& loc, const SynthesisConfig& cfg) {
    const Characteristics& ch = characteristics_for(loc.type);
    const double min_range = ch.minimum_range;
    const int s = effective_signal(loc);

    // A radius far below the minimum range means we hardly know the emitter:
    // grow the denominator toward maximum range as the radius shrinks
    const double accuracy_part = loc.radius > min_range / 2.0
        ? loc.accuracy_estimate
        : min_range + (0.5 - loc.radius / min_range) * ch.maximum_range;

    // Strong signal: probably close, trust a tighter radius
    const double pull = cfg.signal_accuracy_pull * (s - MINIMUM_SIGNAL) / double(MAXIMUM_SIGNAL - MINIMUM_SIGNAL);
    const double adjusted = std::max(min_range, min_range + (1.0 - pull) * (loc.accuracy_estimate - min_range));

    Member m;
    m.lat = loc.lat;
    m.lon = loc.lon;
    m.weight = s / accuracy_part;
    m.sigma_m = adjusted * cfg.accuracy_to_sigma;
    return m;
}

} // namespace

bool weighted_average(const std::vector<RfLocation>& in, FusedLocation& out, const SynthesisConfig& cfg) {
    if (in.empty()) return false;

    std::vector<Member> members;
    members.reserve(in.size());
    bool any_short_range = false;
    bool all_short_range_suspicious = true;
    int64_t newest_ms = in.front().time_ms;
    int64_t newest_ns = in.front().capture_time_ns;
    for (const auto& loc : in) {
        members.push_back(make_member(loc, cfg));
        if (is_short_range(loc.type)) {
            any_short_range = true;
            if (!loc.suspicious) all_short_range_suspicious = false;
        }
        newest_ms = std::max(newest_ms, loc.time_ms);
        newest_ns = std::max(newest_ns, loc.capture_time_ns);
    }

    double w_sum = 0.0, w2_sum = 0.0, lat_sum = 0.0, lon_sum = 0.0;
    for (const auto& m : members) {
        w_sum += m.weight;
        w2_sum += m.weight * m.weight;
        lat_sum += m.lat * m.weight;
        lon_sum += m.lon * m.weight;
    }
    const double lat_mean = lat_sum / w_sum;
    const double lon_mean = lon_sum / w_sum;
    const double lon_scale = geo::DEG_TO_METER * geo::cos_lat(lat_mean);

    double lat_var = 0.0, lon_var = 0.0;
    for (const auto& m : members) {
        const double w2 = m.weight * m.weight;
        const double d_lat = (m.lat - lat_mean) * geo::DEG_TO_METER;
        const double d_lon = (m.lon - lon_mean) * lon_scale;
        if (any_short_range) {
            // WiFi present: spread counts only where it exceeds own accuracy
            const double e_lat = std::max(m.sigma_m, std::fabs(d_lat));
            const double e_lon = std::max(m.sigma_m, std::fabs(d_lon));
            lat_var += w2 * e_lat * e_lat;
            lon_var += w2 * e_lon * e_lon;
        } else {
            lat_var += w2 * (m.sigma_m * m.sigma_m + d_lat * d_lat);
            lon_var += w2 * (m.sigma_m * m.sigma_m + d_lon * d_lon);
        }
    }
    lat_var /= w2_sum;
    lon_var /= w2_sum;

    double accuracy = std::max(cfg.minimum_believable_accuracy, std::sqrt(lat_var + lon_var));
    const bool weak = (any_short_range && all_short_range_suspicious)
        || (in.size() == 1 && in.front().radius < characteristics_for(in.front().type).minimum_range);
    if (weak) accuracy *= cfg.weak_result_inflation;

    out.lat = lat_mean;
    out.lon = lon_mean;
    out.accuracy_m = accuracy;
    out.time_ms = newest_ms;
    out.capture_time_ns = newest_ns;
    out.source_count = (int)in.size();
    return true;
}

} // namespace rfnav::fusion
