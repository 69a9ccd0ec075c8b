/**
 * SuggestionCache.hpp - Shared FIFO cache for suggestions and explanations
 */

#pragma once

#include "hint/Explanation.hpp"
#include "hint/FifoCache.hpp"
#include "hint/HistoryAnalyzer.hpp"
#include "hint/Suggestion.hpp"

#include <string>
#include <variant>
#include <vector>

namespace hint {

// Keys: "<input>:<directory>" for suggestions, "explain:<command>", "structured:<command>",
// "pattern:<directory>:<history>" for remote-enriched pattern analyses
using CacheValue = std::variant<AnalyzeResult, std::string, StructuredExplanation, AnalysisResult>;

struct CategoryCounts {
    size_t suggestions = 0;
    size_t explanations = 0;
    size_t structured = 0;
    size_t patterns = 0;
    size_t other = 0;
};

struct CacheStats {
    size_t size = 0;
    size_t max_size = 0;
    CategoryCounts categories;
    long long pattern_analysis_age_seconds = -1;    // -1 = never analyzed
};

class SuggestionCache : public FifoCache<CacheValue> {
public:
    explicit SuggestionCache(size_t max_size = 100) : FifoCache<CacheValue>(max_size) {}

    CategoryCounts categoryCounts() const;

    static std::string suggestionKey(const std::string& input, const std::string& directory) {
        return input + ":" + directory;
    }
    static std::string explainKey(const std::string& command) { return "explain:" + command; }
    static std::string structuredKey(const std::string& command) { return "structured:" + command; }
    static std::string patternKey(const std::string& directory, const std::vector<std::string>& history);
};

} // namespace hint
