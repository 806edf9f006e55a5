#include "position_synthesis.hpp"

#include "rfnav/geo.hpp"
#include "rfnav/log.hpp"

#include <algorithm>
#include <initializer_list>

namespace rfnav::fusion {

static const char* TAG = "median";

// Centroid distances closer than this count as a tie (meters)
static constexpr double SAME_DISTANCE = 0.01;

double median(std::vector<double> v) {
    if (v.empty()) return 0.0;
    const size_t mid = v.size() / 2;
    std::nth_element(v.begin(), v.begin() + mid, v.end());
    double m = v[mid];
    if (v.size() % 2 == 0) {
        double lower = *std::max_element(v.begin(), v.begin() + mid);
        m = 0.5 * (m + lower);
    }
    return m;
}

std::vector<RfLocation> median_cull(const std::vector<RfLocation>& in, const SynthesisConfig& cfg) {
    std::vector<const RfLocation*> trusted_short, all_short, all;
    for (const auto& loc : in) {
        all.push_back(&loc);
        if (!is_short_range(loc.type)) continue;
        all_short.push_back(&loc);
        if (!loc.suspicious) trusted_short.push_back(&loc);
    }
    const int minimum = cfg.short_range_median_minimum;
    const auto& basis = (int)trusted_short.size() >= minimum ? trusted_short
                      : (int)all_short.size() >= minimum ? all_short
                      : all;

    std::vector<double> lats, lons;
    for (const RfLocation* loc : basis) {
        lats.push_back(loc->lat);
        lons.push_back(loc->lon);
    }
    const double m_lat = median(lats);
    const double m_lon = median(lons);

    std::vector<RfLocation> kept;
    for (const auto& loc : in) {
        if (geo::approximate_distance(m_lat, m_lon, loc.lat, loc.lon) <= cfg.median_keep_factor * loc.accuracy_estimate)
            kept.push_back(loc);
    }
    return kept;
}

namespace {

double distance(const FusedLocation& a, const FusedLocation& b) {
    return geo::approximate_distance(a.lat, a.lon, b.lat, b.lon);
}

} // namespace

bool median_cull_safe(const std::vector<RfLocation>& in, FusedLocation& out, const SynthesisConfig& cfg) {
    if (in.empty()) return false;

    const std::vector<RfLocation> trimmed_set = median_cull(in, cfg);
    if (trimmed_set.size() == in.size()) return weighted_average(in, out, cfg);

    enum { TRIMMED, UNTRIMMED, CULLED };
    FusedLocation candidate[3];
    bool have[3] = {false, false, false};

    have[TRIMMED] = weighted_average(trimmed_set, candidate[TRIMMED], cfg);
    have[UNTRIMMED] = weighted_average(in, candidate[UNTRIMMED], cfg);
    std::vector<RfLocation> culled_set;
    if (cull(in, culled_set, cfg)) have[CULLED] = weighted_average(culled_set, candidate[CULLED], cfg);

    bool safe = have[TRIMMED];
    if (safe) {
        const FusedLocation& t = candidate[TRIMMED];
        const FusedLocation& u = candidate[UNTRIMMED];
        if (distance(t, u) > std::min(t.accuracy_m, u.accuracy_m)) safe = false;
        const double trimmed_fraction = double(in.size() - trimmed_set.size()) / in.size();
        if (trimmed_fraction > cfg.median_max_trim_fraction) safe = false;
        const bool had_short = std::any_of(in.begin(), in.end(), [](const RfLocation& l) { return is_short_range(l.type); });
        const bool kept_short = std::any_of(trimmed_set.begin(), trimmed_set.end(),
                                            [](const RfLocation& l) { return is_short_range(l.type); });
        if (had_short && !kept_short) safe = false;
    }
    if (safe) {
        out = candidate[TRIMMED];
        return true;
    }

    // Per-axis medians can land between two tight clusters; fall back to the
    // candidate nearest the centroid of all candidates. Ties go to culled,
    // then trimmed: the untrimmed average is the one between the clusters.
    double c_lat = 0.0, c_lon = 0.0;
    int n = 0;
    for (int i = 0; i < 3; ++i) {
        if (!have[i]) continue;
        c_lat += candidate[i].lat;
        c_lon += candidate[i].lon;
        ++n;
    }
    c_lat /= n;
    c_lon /= n;
    int chosen = -1;
    double best = 0.0;
    for (int i : {CULLED, TRIMMED, UNTRIMMED}) {
        if (!have[i]) continue;
        double d = geo::approximate_distance(c_lat, c_lon, candidate[i].lat, candidate[i].lon);
        if (chosen < 0 || d < best - SAME_DISTANCE) {
            chosen = i;
            best = d;
        }
    }

    if (chosen == UNTRIMMED && have[TRIMMED]) {
        const FusedLocation& t = candidate[TRIMMED];
        const FusedLocation& u = candidate[UNTRIMMED];
        if (u.accuracy_m > cfg.untrimmed_preference_factor * t.accuracy_m && distance(t, u) <= u.accuracy_m)
            chosen = TRIMMED;
    }
    log::debug(TAG, "median trim of " + std::to_string(in.size() - trimmed_set.size()) + "/"
                        + std::to_string(in.size()) + " failed the safety check, using candidate "
                        + std::to_string(chosen));
    out = candidate[chosen];
    return true;
}

} // namespace rfnav::fusion
