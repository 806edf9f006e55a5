#include "log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <utility>

namespace rfnav::log {

static std::atomic<int> g_level{static_cast<int>(Level::Info)};
static std::mutex g_output_mutex;
static OutputFn g_output;

static const char* level_name(Level level) {
    switch (level) {
        case Level::Error: return "E";
        case Level::Warn: return "W";
        case Level::Info: return "I";
        case Level::Debug: return "D";
        case Level::Verbose: return "V";
        default: return "-";
    }
}

void set_level(Level level) { g_level.store(static_cast<int>(level)); }
Level level() { return static_cast<Level>(g_level.load()); }
bool enabled(Level l) { return l != Level::None && static_cast<int>(l) <= g_level.load(); }

void set_output(OutputFn fn) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    g_output = std::move(fn);
}

void write(Level l, const char* tag, const std::string& msg) {
    if (!enabled(l)) return;
    std::lock_guard<std::mutex> lock(g_output_mutex);
    if (g_output) {
        g_output(l, tag, msg);
        return;
    }
    std::ostream& os = (l == Level::Error || l == Level::Warn) ? std::cerr : std::cout;
    os << level_name(l) << " [" << tag << "] " << msg << std::endl;
}

} // namespace rfnav::log
