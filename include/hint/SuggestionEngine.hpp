/**
 * SuggestionEngine.hpp - Combines corrections, history patterns, offline tables and the remote endpoint
 */

#pragma once

#include "hint/CommandParser.hpp"
#include "hint/Config.hpp"
#include "hint/CorrectionEngine.hpp"
#include "hint/ExplainerEngine.hpp"
#include "hint/HistoryAnalyzer.hpp"
#include "hint/HistorySearch.hpp"
#include "hint/InferenceAdapter.hpp"
#include "hint/Suggestion.hpp"
#include "hint/SuggestionCache.hpp"

#include <memory>
#include <string>
#include <vector>

namespace hint {

class ContextProvider;
class InferenceClient;

class SuggestionEngine {
public:
    // client and provider are borrowed and must outlive the engine.
    // Without a client (or with config.isOffline()) the engine runs offline.
    explicit SuggestionEngine(const EngineConfig& config,
                              InferenceClient* client = nullptr,
                              ContextProvider* provider = nullptr);
    ~SuggestionEngine();

    SuggestionEngine(const SuggestionEngine&) = delete;
    SuggestionEngine& operator=(const SuggestionEngine&) = delete;

    // Never throws; failures degrade to fewer suggestions
    AnalyzeResult analyze(const std::string& input, const TerminalContext& context);

    Explanation explain(const std::string& command);

    // Fewer than two entries yield an empty analysis
    AnalysisResult analyzePatterns(const std::vector<std::string>& history,
                                   const TerminalContext& context);

    // Searches history (most recent first) for commands matching a natural-language query
    SearchResult searchHistory(const std::string& query, const std::vector<std::string>& history,
                               const TerminalContext& context);

    void clearCache();
    size_t clearCacheByPrefix(const std::string& prefix);
    CacheStats getCacheStats() const;

    bool isOffline() const { return offline_; }
    // History analyses actually computed (memo misses)
    size_t analysisCount() const { return analyzer_.computeCount(); }
    const EngineConfig& config() const { return config_; }

private:
    EngineConfig config_;
    bool offline_;
    ContextProvider* provider_;

    CommandParser parser_;
    SuggestionCache cache_;
    CorrectionEngine corrections_;
    HistoryAnalyzer analyzer_;
    std::unique_ptr<InferenceAdapter> adapter_;
    ExplainerEngine explainer_;
    HistorySearch search_;

    AnalyzeResult compute(const std::string& input, const TerminalContext& context, bool& fell_back);
    std::vector<Suggestion> patternSuggestions(const std::string& input, const TerminalContext& context);
    std::vector<Suggestion> offlineSuggestions(const std::string& input, const TerminalContext& context);
    std::vector<Suggestion> finish(const std::vector<Suggestion>& combined) const;
};

} // namespace hint
