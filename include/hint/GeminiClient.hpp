/**
 * GeminiClient.hpp - HTTP client for Gemini API
 */

#pragma once

#include "hint/InferenceClient.hpp"

#include <functional>
#include <memory>
#include <string>

namespace hint {

class GeminiClient : public InferenceClient {
public:
    // Callback for streaming responses
    using StreamCallback = std::function<void(const std::string& chunk)>;

    GeminiClient(const std::string& api_key, const std::string& model = "",
                 const std::string& language = "", int timeout_seconds = 10);
    ~GeminiClient() override;

    InferenceResponse complete(const InferenceRequest& request) override;

    // Plain-text generation delivered chunk by chunk (SSE); returns the full text
    InferenceResponse completeStreaming(const InferenceRequest& request, StreamCallback on_chunk);

    // Validate API key and model by making a test request
    bool validate(std::string& error_message);

    static std::string getDefaultModel();
    static std::string getDefaultLanguage();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hint
