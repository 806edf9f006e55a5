#pragma once

#include <array>
#include <string>

#include "emitter_type.hpp"

namespace rfnav {

// Some radios report the same signal for every emitter of a type. Until a
// type shows a second distinct value its readings carry no information and
// are replaced by MINIMUM_SIGNAL. Only used from the engine worker.
class SignalCorrection {
public:
    SignalCorrection();

    // Clamped, then corrected
    int corrected(EmitterType type, int signal);

    // 0 after a differing value was seen, the first value while all agree,
    // -1 before any value
    int stored(EmitterType type) const;
    bool trusted(EmitterType type) const { return stored(type) == TRUSTED; }

    bool dirty() const { return dirty_; }

    // Missing file leaves everything unseen and returns false
    bool load(const char* path);
    // Clears the dirty flag on success
    bool save(const char* path);

    static constexpr int UNSEEN = -1;
    static constexpr int TRUSTED = 0;

private:
    static constexpr size_t TYPE_COUNT = static_cast<size_t>(EmitterType::INVALID) + 1;
    std::array<int, TYPE_COUNT> values_;
    bool dirty_ = false;
};

} // namespace rfnav
