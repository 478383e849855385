#pragma once

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace textgate {
namespace log {

enum class Level { Debug, Info, Warn, Error };

namespace detail {

inline Level& threshold() {
    static Level level = Level::Info;
    return level;
}

inline std::mutex& mutex() {
    static std::mutex m;
    return m;
}

inline const char* tag(Level level) {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        default:           return "?";
    }
}

} // namespace detail

// Set once from main before any worker starts.
inline void set_level(Level level) { detail::threshold() = level; }
inline Level level() { return detail::threshold(); }

inline bool enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(detail::threshold());
}

// Writes one line to stderr. Report output owns stdout.
inline void write(Level level, const std::string& message) {
    if (!enabled(level)) return;
    std::ostringstream line;
    line << "textgate [" << detail::tag(level) << "] " << message << "\n";
    std::lock_guard<std::mutex> lock(detail::mutex());
    std::cerr << line.str();
}

inline void debug(const std::string& m) { write(Level::Debug, m); }
inline void info(const std::string& m)  { write(Level::Info, m); }
inline void warn(const std::string& m)  { write(Level::Warn, m); }
inline void error(const std::string& m) { write(Level::Error, m); }

} // namespace log
} // namespace textgate
