#pragma once

#include <string>

#include "identity.hpp"

namespace rfnav {

// Checks whether an emitter's label marks it as likely mobile: phone
// tethering defaults, in-car WiFi defaults, buses and trains. Only WiFi is
// checked; cell towers and Bluetooth never match.
bool label_blacklisted(const Identity& identity, const std::string& label);

} // namespace rfnav
