/**
 * InferenceClient.hpp - Text-completion backend used by the remote adapter
 */

#pragma once

#include <string>

namespace hint {

struct InferenceRequest {
    std::string system_instruction;
    std::string prompt;
    double temperature = 0.3;
    int max_tokens = 150;
};

struct InferenceResponse {
    std::string content;
    bool success = false;
    std::string error;
};

class InferenceClient {
public:
    virtual ~InferenceClient() = default;

    // One request, no retries; failures are reported in the response, never thrown
    virtual InferenceResponse complete(const InferenceRequest& request) = 0;
};

} // namespace hint
