#pragma once

#include "engine_settings.hpp"

namespace rfnav {

// Keys absent from the file keep their current value
bool load_settings(const char* path, EngineSettings& st);
bool save_settings(const char* path, const EngineSettings& st);

} // namespace rfnav
