/**
 * HistorySearch.hpp - Natural-language search over command history
 */

#pragma once

#include "hint/FifoCache.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace hint {

class InferenceAdapter;

struct Timeframe {
    std::string label;          // the phrase found in the query ("today", "this week", ...)
    std::chrono::hours window;
};

struct SearchMatch {
    std::string command;
    double score = 0.0;
    std::string match_type;     // exact, prefix, a category, substring, keyword, or the endpoint's label
    std::string reason;
    // Approximate: history carries no times, so each position back is ten minutes older
    std::chrono::system_clock::time_point timestamp;
    std::string directory;
};

struct SearchResult {
    std::vector<SearchMatch> results;
    std::string query;
    bool offline = true;
    std::optional<Timeframe> timeframe;
};

class HistorySearch {
public:
    // Without an adapter every search is local
    explicit HistorySearch(InferenceAdapter* adapter = nullptr, size_t cache_size = 20);

    // Remote results are cached per (query, directory); local ones are recomputed. Never throws.
    SearchResult search(const std::string& query, const std::vector<std::string>& history,
                        const std::string& directory);

    // Keyword, prefix, category and timeframe scoring with a recency boost, top 10
    SearchResult localSearch(const std::string& query, const std::vector<std::string>& history,
                             const std::string& directory) const;

    // Case-insensitive substring filter, newest first
    SearchResult basicSearch(const std::string& query, const std::vector<std::string>& history,
                             const std::string& directory) const;

    size_t cachedCount() const { return cache_.size(); }
    void clear() { cache_.clear(); }

private:
    InferenceAdapter* adapter_;
    FifoCache<SearchResult> cache_;

    SearchResult remoteSearch(const std::string& query, const std::vector<std::string>& history,
                              const std::string& directory);
};

// Lowercased query words longer than two characters, minus filler and time words
std::vector<std::string> extractKeywords(const std::string& query);

std::optional<Timeframe> extractTimeframe(const std::string& query);

// Category names (git, network, filesystem, process, package, docker) named by a query word
std::vector<std::string> extractCategories(const std::string& query);

bool isCommandInCategory(const std::string& command, const std::string& category);

std::string searchMatchType(const std::string& command, const std::string& query,
                            const std::vector<std::string>& categories);

std::string searchMatchReason(const std::string& command, const std::string& query,
                              const std::vector<std::string>& categories,
                              const std::vector<std::string>& keywords);

} // namespace hint
