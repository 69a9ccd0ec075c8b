/**
 * Config.hpp - Engine settings from keyring, environment and config file
 */

#pragma once

#include <cstddef>
#include <string>

namespace hint {

struct EngineConfig {
    bool offline = false;           // forced offline; an empty api_key is offline too
    std::string api_key;
    std::string model;
    std::string language;
    size_t min_input_length = 2;
    int debounce_ms = 150;
    size_t cache_size = 100;
    size_t max_suggestions = 7;
    size_t history_depth = 20;
    int timeout_seconds = 10;

    bool isOffline() const { return offline || api_key.empty(); }
};

// Keyring, then HINT_API_KEY / GEMINI_API_KEY, then ~/.config/hint/api_key
std::string getApiKey();

std::string getFromKeyring(const std::string& type);
bool storeInKeyring(const std::string& type, const std::string& value, const std::string& label);

// ~/.config/hint (empty when HOME is unset)
std::string configDir();

// Overlays offline and the numeric limits from a JSON config file (model and language live in the
// keyring); returns false (and logs) when unreadable or malformed
bool applyConfigFile(EngineConfig& config, const std::string& path);

// Writes one key into ~/.config/hint/config.json, keeping the others
bool storeConfigValue(const std::string& key, const std::string& value);

// Everything above plus HINT_OFFLINE; never throws
EngineConfig loadConfig();

} // namespace hint
