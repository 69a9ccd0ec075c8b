/**
 * Log.hpp - Leveled diagnostics on stderr
 */

#pragma once

#include <functional>
#include <string>

namespace hint {
namespace log {

enum class Level {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    OFF
};

// Receives every line that passes the threshold (already formatted, no newline)
using Sink = std::function<void(Level level, const std::string& line)>;

void setLevel(Level level);
Level level();

// Parses "debug", "info", "warn", "error", "off"; anything else yields fallback
Level parseLevel(const std::string& name, Level fallback);

// Replace the stderr writer (tests capture lines with this); nullptr restores stderr
void setSink(Sink sink);

void write(Level level, const std::string& component, const std::string& message);

inline void debug(const std::string& component, const std::string& message) {
    write(Level::DEBUG, component, message);
}

inline void info(const std::string& component, const std::string& message) {
    write(Level::INFO, component, message);
}

inline void warn(const std::string& component, const std::string& message) {
    write(Level::WARN, component, message);
}

inline void error(const std::string& component, const std::string& message) {
    write(Level::ERROR, component, message);
}

} // namespace log
} // namespace hint
