/**
 * GeminiClient.cpp - HTTP client for Gemini API
 *
 * Uses cpp-httplib for one-shot HTTPS requests and libcurl for
 * server-sent-event streaming.
 */

#include "hint/GeminiClient.hpp"
#include "hint/Log.hpp"

#include <curl/curl.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace hint {

static const std::string GEMINI_API_BASE = "generativelanguage.googleapis.com";
static const std::string DEFAULT_MODEL = "gemini-2.5-flash";
static const std::string DEFAULT_LANGUAGE = "en-us";

namespace {

// Pulls candidates[0].content.parts[0].text out of a response or stream event
bool extractText(const json& body, std::string& text) {
    if (body.contains("candidates") &&
        !body["candidates"].empty() &&
        body["candidates"][0].contains("content") &&
        body["candidates"][0]["content"].contains("parts") &&
        !body["candidates"][0]["content"]["parts"].empty() &&
        body["candidates"][0]["content"]["parts"][0].contains("text")) {
        text = body["candidates"][0]["content"]["parts"][0]["text"].get<std::string>();
        return true;
    }
    return false;
}

// Curl write callback data
struct CurlStreamContext {
    std::string buffer;
    std::string accumulated;
    GeminiClient::StreamCallback callback;
};

size_t curlWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<CurlStreamContext*>(userdata);
    size_t total = size * nmemb;
    ctx->buffer.append(ptr, total);

    // Parse SSE events as they arrive
    size_t pos;
    while ((pos = ctx->buffer.find("\n")) != std::string::npos) {
        std::string line = ctx->buffer.substr(0, pos);
        ctx->buffer.erase(0, pos + 1);

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line.rfind("data: ", 0) != 0) continue;

        try {
            std::string chunk;
            if (extractText(json::parse(line.substr(6)), chunk)) {
                ctx->accumulated += chunk;
                if (ctx->callback) {
                    ctx->callback(chunk);
                }
            }
        } catch (const json::exception& e) {
            log::debug("gemini", std::string("ignoring malformed stream event: ") + e.what());
        }
    }

    return total;
}

} // anonymous namespace

struct GeminiClient::Impl {
    std::string api_key;
    std::string model;
    std::string language;
    int timeout_seconds;
    std::unique_ptr<httplib::SSLClient> client;

    Impl(const std::string& key, const std::string& model_name,
         const std::string& lang, int timeout)
        : api_key(key),
          model(model_name.empty() ? DEFAULT_MODEL : model_name),
          language(lang.empty() ? DEFAULT_LANGUAGE : lang),
          timeout_seconds(timeout > 0 ? timeout : 10) {

        client = std::make_unique<httplib::SSLClient>(GEMINI_API_BASE);
        client->set_connection_timeout(timeout_seconds);
        client->set_read_timeout(timeout_seconds);
        client->set_write_timeout(timeout_seconds);
    }

    std::string getLanguageInstruction() {
        if (language == "en-us" || language == "en") {
            return "Respond in English.";
        } else if (language == "pt-br" || language == "pt") {
            return "Respond in Portuguese (Brazilian).";
        } else if (language == "es" || language == "es-es") {
            return "Respond in Spanish.";
        } else {
            return "Respond in " + language + ".";
        }
    }

    std::string buildEndpoint(const std::string& method) {
        return "/v1beta/models/" + model + ":" + method + "?key=" + api_key;
    }

    json buildBody(const InferenceRequest& request) {
        json body = {
            {"contents", json::array({
                {{"role", "user"}, {"parts", {{{"text", request.prompt}}}}}
            })},
            {"generationConfig", {
                {"temperature", request.temperature},
                {"maxOutputTokens", request.max_tokens}
            }}
        };

        std::string system = request.system_instruction;
        if (!system.empty()) system += " ";
        system += getLanguageInstruction();
        body["system_instruction"] = {{"parts", {{{"text", system}}}}};

        return body;
    }

    InferenceResponse sendRequest(const InferenceRequest& request) {
        InferenceResponse response;

        auto res = client->Post(buildEndpoint("generateContent"), buildBody(request).dump(),
                                "application/json");

        if (!res) {
            response.success = false;
            response.error = "Network error: " + httplib::to_string(res.error());
            return response;
        }

        if (res->status != 200) {
            response.success = false;
            response.error = "API error: HTTP " + std::to_string(res->status);
            try {
                json error_json = json::parse(res->body);
                if (error_json.contains("error") && error_json["error"].contains("message")) {
                    response.error += " - " + error_json["error"]["message"].get<std::string>();
                }
            } catch (const json::exception&) {
                // Body was not JSON; the status code alone is reported
            }
            return response;
        }

        try {
            if (extractText(json::parse(res->body), response.content)) {
                response.success = true;
            } else {
                response.success = false;
                response.error = "Invalid response structure";
            }
        } catch (const json::exception& e) {
            response.success = false;
            response.error = std::string("JSON parse error: ") + e.what();
        }

        return response;
    }
};

GeminiClient::GeminiClient(const std::string& api_key, const std::string& model,
                           const std::string& language, int timeout_seconds)
    : impl_(std::make_unique<Impl>(api_key, model, language, timeout_seconds)) {}

GeminiClient::~GeminiClient() = default;

std::string GeminiClient::getDefaultModel() {
    return DEFAULT_MODEL;
}

std::string GeminiClient::getDefaultLanguage() {
    return DEFAULT_LANGUAGE;
}

InferenceResponse GeminiClient::complete(const InferenceRequest& request) {
    return impl_->sendRequest(request);
}

bool GeminiClient::validate(std::string& error_message) {
    InferenceRequest request;
    request.prompt = "Respond with only the word OK";
    request.max_tokens = 10;

    auto response = impl_->sendRequest(request);
    if (!response.success) {
        error_message = response.error;
        return false;
    }
    return true;
}

InferenceResponse GeminiClient::completeStreaming(const InferenceRequest& request, StreamCallback on_chunk) {
    InferenceResponse result;

    std::string body = impl_->buildBody(request).dump();
    std::string url = "https://" + GEMINI_API_BASE + impl_->buildEndpoint("streamGenerateContent") + "&alt=sse";

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.error = "Failed to initialize curl";
        return result;
    }

    CurlStreamContext ctx;
    ctx.callback = on_chunk;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(impl_->timeout_seconds * 6));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(impl_->timeout_seconds));
    // Streaming options - minimize buffering
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, 1024L);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);

    CURLcode res = curl_easy_perform(curl);

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        result.error = std::string("Curl error: ") + curl_easy_strerror(res);
        return result;
    }

    if (status != 200) {
        result.error = "API error: HTTP " + std::to_string(status);
        return result;
    }

    result.content = ctx.accumulated;
    result.success = !ctx.accumulated.empty();
    if (!result.success) {
        result.error = "Empty response stream";
    }
    return result;
}

} // namespace hint
