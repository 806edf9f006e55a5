#pragma once

namespace rfnav {

enum class CullMode {
    MedianSafe = 0, // cluster gate, then median-trimmed average with safety check
    None = 1,       // weighted average of everything
    Cluster = 2     // weighted average of the largest compatible group
};

// Tuned constants of position synthesis
struct SynthesisConfig {
    // Two emitters are compatible within this factor of their accuracy sum
    double group_distance_factor = 1.25;
    // Floor for any reported accuracy (meters)
    double minimum_believable_accuracy = 15.0;
    // How far a full-strength signal pulls accuracy toward minimum range
    double signal_accuracy_pull = 0.7;
    // Coverage accuracy is taken as two sigma
    double accuracy_to_sigma = 0.5;

    // Median trim keeps members within this many own accuracies
    double median_keep_factor = 2.0;
    // Safety check fails when more than this fraction was trimmed
    double median_max_trim_fraction = 0.2;
    // Short-range members needed to base the median on them alone
    int short_range_median_minimum = 3;
    // Untrimmed result this much worse than trimmed loses despite being closer
    double untrimmed_preference_factor = 2.0;

    // Applied to results that rest on weak evidence only
    double weak_result_inflation = 1.5;
};

} // namespace rfnav
