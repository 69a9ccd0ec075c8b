/**
 * ExplainerEngine.cpp - Command explanations, offline table or remote endpoint
 */

#include "hint/ExplainerEngine.hpp"
#include "hint/CommandParser.hpp"
#include "hint/InferenceAdapter.hpp"
#include "hint/Log.hpp"
#include "hint/OfflineCatalog.hpp"
#include "hint/SuggestionCache.hpp"

namespace hint {

ExplainerEngine::ExplainerEngine(SuggestionCache& cache, InferenceAdapter* adapter)
    : cache_(cache), adapter_(adapter) {}

ExplainerEngine::~ExplainerEngine() = default;

StructuredExplanation ExplainerEngine::fallbackFor(const std::string& command) {
    return {command, offlineExplanation(baseCommand(command)), {}, {}};
}

Explanation ExplainerEngine::explain(const std::string& command) {
    std::string trimmed = trim(command);
    if (trimmed.empty()) {
        return std::string();
    }

    std::string key = SuggestionCache::explainKey(trimmed);
    if (auto cached = cache_.get(key)) {
        if (auto* text = std::get_if<std::string>(&*cached)) {
            return *text;
        }
    }

    std::string base = baseCommand(trimmed);

    if (!adapter_) {
        std::string explanation = offlineExplanation(base);
        cache_.set(key, explanation);
        return explanation;
    }

    if (prefersStructuredExplanation(base)) {
        return explainStructured(trimmed);
    }

    auto response = adapter_->explain(trimmed);
    if (!response.success || response.content.empty()) {
        log::warn("explain", "remote explanation failed, using offline text: " + response.error);
        std::string fallback = offlineExplanation(base);
        cache_.set(key, fallback);
        return fallback;
    }

    cache_.set(key, response.content);
    return response.content;
}

StructuredExplanation ExplainerEngine::explainStructured(const std::string& command) {
    std::string key = SuggestionCache::structuredKey(command);
    if (auto cached = cache_.get(key)) {
        if (auto* structured = std::get_if<StructuredExplanation>(&*cached)) {
            return *structured;
        }
    }

    if (!adapter_) {
        return fallbackFor(command);
    }

    auto response = adapter_->explainStructured(command);
    if (!response.success) {
        // Transport failures are not cached so the next request retries
        log::warn("explain", "structured explanation request failed: " + response.error);
        return fallbackFor(command);
    }

    auto parsed = parseStructuredExplanation(response.content);
    if (!parsed) {
        log::warn("explain", "unusable structured explanation for '" + command + "', using fallback");
        StructuredExplanation fallback = fallbackFor(command);
        cache_.set(key, fallback);
        return fallback;
    }

    cache_.set(key, *parsed);
    return *parsed;
}

} // namespace hint
