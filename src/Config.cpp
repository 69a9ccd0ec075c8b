/**
 * Config.cpp - Engine settings from keyring, environment and config file
 */

#include "hint/Config.hpp"
#include "hint/GeminiClient.hpp"
#include "hint/Log.hpp"

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

#include <libsecret/secret.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace hint {

namespace {

// libsecret schema for storing the API key and model settings
const SecretSchema HINT_SECRET_SCHEMA = {
    "com.hint.credentials",
    SECRET_SCHEMA_NONE,
    {
        {"type", SECRET_SCHEMA_ATTRIBUTE_STRING},
        {NULL, SECRET_SCHEMA_ATTRIBUTE_STRING}
    }
};

std::string envValue(const char* name) {
    const char* value = std::getenv(name);
    return (value && strlen(value) > 0) ? std::string(value) : std::string();
}

bool truthy(const std::string& value) {
    return value == "1" || value == "true" || value == "on" || value == "yes";
}

// Values below 1 are ignored; fractions truncate and oversized values clamp to T's range
template <typename T>
void readNumber(const json& body, const char* key, T& target) {
    if (!body.contains(key) || !body[key].is_number()) {
        return;
    }

    double value = body[key].get<double>();
    if (value < 1) {
        log::warn("config", std::string("ignoring ") + key + " below 1");
        return;
    }

    constexpr T max = std::numeric_limits<T>::max();
    if (value >= static_cast<double>(max)) {
        log::warn("config", std::string(key) + " too large, using " + std::to_string(max));
        target = max;
        return;
    }
    target = static_cast<T>(value);
}

} // anonymous namespace

std::string getFromKeyring(const std::string& type) {
    GError* error = nullptr;
    gchar* value = secret_password_lookup_sync(
        &HINT_SECRET_SCHEMA,
        nullptr,
        &error,
        "type", type.c_str(),
        NULL
    );

    if (error != nullptr) {
        log::debug("config", std::string("keyring lookup failed: ") + error->message);
        g_error_free(error);
        return "";
    }

    if (value == nullptr) {
        return "";
    }

    std::string result(value);
    secret_password_free(value);
    return result;
}

bool storeInKeyring(const std::string& type, const std::string& value, const std::string& label) {
    GError* error = nullptr;
    gboolean success = secret_password_store_sync(
        &HINT_SECRET_SCHEMA,
        SECRET_COLLECTION_DEFAULT,
        label.c_str(),
        value.c_str(),
        nullptr,
        &error,
        "type", type.c_str(),
        NULL
    );

    if (error != nullptr) {
        log::error("config", std::string("keyring store failed: ") + error->message);
        g_error_free(error);
        return false;
    }

    return success == TRUE;
}

std::string configDir() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return (std::filesystem::path(home) / ".config" / "hint").string();
}

std::string getApiKey() {
    // 1. Try libsecret/keyring first (most secure)
    std::string key = getFromKeyring("api_key");
    if (!key.empty()) {
        return key;
    }

    // 2. Try environment variables
    key = envValue("HINT_API_KEY");
    if (key.empty()) key = envValue("GEMINI_API_KEY");
    if (!key.empty()) {
        return key;
    }

    // 3. Try config file (fallback)
    std::string dir = configDir();
    if (dir.empty()) return "";

    std::filesystem::path key_path = std::filesystem::path(dir) / "api_key";
    std::error_code ec;
    if (std::filesystem::exists(key_path, ec)) {
        std::ifstream file(key_path);
        std::getline(file, key);
    }

    return key;
}

bool applyConfigFile(EngineConfig& config, const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        return false;
    }

    try {
        json body;
        file >> body;
        if (!body.is_object()) {
            log::warn("config", path + " is not a JSON object, keeping defaults");
            return false;
        }

        if (body.contains("offline") && body["offline"].is_boolean()) {
            config.offline = body["offline"].get<bool>();
        }
        readNumber(body, "min_input_length", config.min_input_length);
        readNumber(body, "debounce_ms", config.debounce_ms);
        readNumber(body, "cache_size", config.cache_size);
        readNumber(body, "max_suggestions", config.max_suggestions);
        readNumber(body, "history_depth", config.history_depth);
        readNumber(body, "timeout_seconds", config.timeout_seconds);
    } catch (const json::exception& e) {
        log::warn("config", "malformed " + path + ": " + e.what());
        return false;
    }

    return true;
}

bool storeConfigValue(const std::string& key, const std::string& value) {
    std::string dir = configDir();
    if (dir.empty()) {
        log::error("config", "HOME is not set");
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        log::error("config", "cannot create " + dir + ": " + ec.message());
        return false;
    }

    std::string path = dir + "/config.json";
    json body = json::object();
    {
        std::ifstream in(path);
        if (in.good()) {
            try {
                in >> body;
            } catch (const json::exception& e) {
                log::warn("config", "replacing malformed " + path + ": " + e.what());
                body = json::object();
            }
        }
    }
    if (!body.is_object()) {
        body = json::object();
    }

    if (key == "offline") {
        body[key] = truthy(value);
    } else if (!value.empty() && value.size() < 10 &&
               value.find_first_not_of("0123456789") == std::string::npos) {
        body[key] = std::stoll(value);
    } else {
        body[key] = value;
    }

    std::ofstream out(path);
    out << body.dump(2);
    return out.good();
}

EngineConfig loadConfig() {
    EngineConfig config;

    std::string model = getFromKeyring("model");
    config.model = model.empty() ? GeminiClient::getDefaultModel() : model;
    std::string language = getFromKeyring("language");
    config.language = language.empty() ? GeminiClient::getDefaultLanguage() : language;

    std::string dir = configDir();
    if (!dir.empty()) {
        applyConfigFile(config, dir + "/config.json");
    }

    config.api_key = getApiKey();

    if (truthy(envValue("HINT_OFFLINE"))) {
        config.offline = true;
    }

    return config;
}

} // namespace hint
