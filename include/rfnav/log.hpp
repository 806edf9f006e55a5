#pragma once

#include <functional>
#include <string>

namespace rfnav::log {

enum class Level {
    None = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Debug = 4,
    Verbose = 5
};

using OutputFn = std::function<void(Level level, const char* tag, const std::string& msg)>;

void set_level(Level level);
Level level();
bool enabled(Level level);

// Empty function restores the console output
void set_output(OutputFn fn);

void write(Level level, const char* tag, const std::string& msg);

inline void error(const char* tag, const std::string& msg) { write(Level::Error, tag, msg); }
inline void warn(const char* tag, const std::string& msg) { write(Level::Warn, tag, msg); }
inline void info(const char* tag, const std::string& msg) { write(Level::Info, tag, msg); }
inline void debug(const char* tag, const std::string& msg) { write(Level::Debug, tag, msg); }
inline void verbose(const char* tag, const std::string& msg) { write(Level::Verbose, tag, msg); }

} // namespace rfnav::log
