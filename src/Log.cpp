/**
 * Log.cpp - Leveled diagnostics on stderr
 */

#include "hint/Log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace hint {
namespace log {

namespace {

const std::string RESET = "\033[0m";
const std::string YELLOW = "\033[33m";
const std::string RED = "\033[31m";
const std::string CYAN = "\033[36m";

std::mutex& logMutex() {
    static std::mutex m;
    return m;
}

Level initialLevel() {
    const char* env = std::getenv("HINT_LOG_LEVEL");
    if (!env) return Level::WARN;
    return parseLevel(env, Level::WARN);
}

Level& currentLevel() {
    static Level lvl = initialLevel();
    return lvl;
}

Sink& currentSink() {
    static Sink sink;
    return sink;
}

const char* levelName(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
        default:           return "";
    }
}

const std::string& levelColor(Level level) {
    static const std::string none;
    switch (level) {
        case Level::DEBUG: return CYAN;
        case Level::WARN:  return YELLOW;
        case Level::ERROR: return RED;
        default:           return none;
    }
}

} // anonymous namespace

void setLevel(Level level) {
    std::lock_guard<std::mutex> lock(logMutex());
    currentLevel() = level;
}

Level level() {
    std::lock_guard<std::mutex> lock(logMutex());
    return currentLevel();
}

Level parseLevel(const std::string& name, Level fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    if (lower == "off" || lower == "none") return Level::OFF;
    return fallback;
}

void setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(logMutex());
    currentSink() = std::move(sink);
}

void write(Level level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex());
    if (level == Level::OFF || level < currentLevel()) {
        return;
    }

    std::string line = std::string("[hint] ") + levelName(level) + " " + component + ": " + message;

    if (currentSink()) {
        currentSink()(level, line);
        return;
    }

    std::cerr << levelColor(level) << line << RESET << "\n";
}

} // namespace log
} // namespace hint
