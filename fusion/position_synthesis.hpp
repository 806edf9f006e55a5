#pragma once

#include <vector>

#include "rfnav/rf_location.hpp"
#include "rfnav/synthesis_config.hpp"

namespace rfnav::fusion {

// Largest group of mutually compatible locations. A single non-INVALID
// location is accepted as is. Otherwise the group must reach the minimum
// group size of at least one member. False for "no fusible set".
bool cull(const std::vector<RfLocation>& in, std::vector<RfLocation>& out,
          const SynthesisConfig& cfg = SynthesisConfig());

// Signal and accuracy weighted mean. False only for empty input.
bool weighted_average(const std::vector<RfLocation>& in, FusedLocation& out,
                      const SynthesisConfig& cfg = SynthesisConfig());

// Members within median_keep_factor own accuracies of the per-axis median
// point. The median is taken over the preferred subset (non-suspicious
// short-range, then short-range, then everything).
std::vector<RfLocation> median_cull(const std::vector<RfLocation>& in,
                                    const SynthesisConfig& cfg = SynthesisConfig());

// Median-trimmed average unless it disagrees with the alternatives, in which
// case the candidate closest to their centroid. False for empty input.
bool median_cull_safe(const std::vector<RfLocation>& in, FusedLocation& out,
                      const SynthesisConfig& cfg = SynthesisConfig());

// One fused location from one reporting period. Never reports positions
// near null island.
bool synthesize(const std::vector<RfLocation>& in, CullMode mode, FusedLocation& out,
                const SynthesisConfig& cfg = SynthesisConfig());

// Middle value, mean of the two middle values for even sizes. 0 if empty.
double median(std::vector<double> v);

} // namespace rfnav::fusion
