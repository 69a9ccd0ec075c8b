/**
 * SuggestionCache.cpp - Shared FIFO cache for suggestions and explanations
 */

#include "hint/SuggestionCache.hpp"
#include "hint/CommandParser.hpp"

namespace hint {

CategoryCounts SuggestionCache::categoryCounts() const {
    CategoryCounts counts;

    for (const auto& key : keys()) {
        if (startsWith(key, "explain:")) {
            counts.explanations++;
        } else if (startsWith(key, "structured:")) {
            counts.structured++;
        } else if (startsWith(key, "pattern:")) {
            counts.patterns++;
        } else if (key.find(':') != std::string::npos) {
            counts.suggestions++;
        } else {
            counts.other++;
        }
    }

    return counts;
}

std::string SuggestionCache::patternKey(const std::string& directory, const std::vector<std::string>& history) {
    std::string key = "pattern:" + directory + ":";
    for (size_t i = 0; i < history.size(); ++i) {
        if (i > 0) key += "\n";
        key += history[i];
    }
    return key;
}

} // namespace hint
