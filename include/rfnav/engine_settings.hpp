#pragma once

#include <string>

#include "emitter_cache.hpp"
#include "log.hpp"
#include "synthesis_config.hpp"

namespace rfnav {

struct EngineSettings {
    std::string database_path = "rfnav.db";
    std::string signal_correction_path = "rfnav_signal.json"; // empty: not persisted
    CullMode cull_mode = CullMode::MedianSafe;
    log::Level log_level = log::Level::Info;

    CacheConfig cache;
    SynthesisConfig synthesis;
};

} // namespace rfnav
