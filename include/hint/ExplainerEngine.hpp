/**
 * ExplainerEngine.hpp - Command explanations, offline table or remote endpoint
 */

#pragma once

#include "hint/Explanation.hpp"

#include <string>

namespace hint {

class InferenceAdapter;
class SuggestionCache;

class ExplainerEngine {
public:
    // adapter == nullptr means offline: only the static table is consulted
    ExplainerEngine(SuggestionCache& cache, InferenceAdapter* adapter);
    ~ExplainerEngine();

    Explanation explain(const std::string& command);

    // Always yields an object; malformed replies degrade to fallbackFor(command)
    StructuredExplanation explainStructured(const std::string& command);

    static StructuredExplanation fallbackFor(const std::string& command);

private:
    SuggestionCache& cache_;
    InferenceAdapter* adapter_;
};

} // namespace hint
