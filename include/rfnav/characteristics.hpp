#pragma once

#include "emitter_type.hpp"

namespace rfnav {

// Static radio model for one emitter type
struct Characteristics {
    float required_fix_accuracy; // meters; worse fixes are not used to learn coverage
    double minimum_range;        // meters; floor for any coverage estimate
    double maximum_range;        // meters; larger coverage means the emitter moved
    int minimum_group_size;      // emitters needed before a location is believable
};

const Characteristics& characteristics_for(EmitterType type);

} // namespace rfnav
