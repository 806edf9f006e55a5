#include "observation.hpp"

#include <algorithm>

namespace rfnav {

int clamp_signal(int signal) {
    return std::min(MAXIMUM_SIGNAL, std::max(MINIMUM_SIGNAL, signal));
}

} // namespace rfnav
