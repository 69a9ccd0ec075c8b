/**
 * HistorySearch.cpp - Natural-language search over command history
 */

#include "hint/HistorySearch.hpp"
#include "hint/CommandParser.hpp"
#include "hint/InferenceAdapter.hpp"
#include "hint/Log.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <regex>
#include <unordered_set>
#include <utility>

namespace hint {

namespace {

const size_t MAX_RESULTS = 10;
const std::chrono::minutes POSITION_AGE(10);

const double KEYWORD_SCORE = 0.2;
const double EXACT_SCORE = 0.8;
const double PREFIX_SCORE = 0.5;
const double CATEGORY_SCORE = 0.3;
const double RECENCY_BOOST = 0.3;
const double RECENCY_STEP = 0.01;
const double MIN_SCORE = 0.2;
const double BASIC_STEP = 0.05;

const std::unordered_set<std::string> STOP_WORDS = {
    "the", "a", "an", "in", "on", "at", "by", "for", "with", "about", "from", "to", "of",
    "search", "find", "show", "display", "list", "get", "my", "me", "commands", "command",
    "today", "yesterday", "this", "last", "week", "month", "days", "hours", "ran", "did", "used"
};

struct TimePattern {
    std::regex matcher;
    std::string label;
    std::chrono::hours window;
};

// Evaluated in order, first match wins
const std::vector<TimePattern>& timePatterns() {
    static const std::vector<TimePattern> patterns = {
        {std::regex("today|last 24 hours"), "today", std::chrono::hours(24)},
        {std::regex("yesterday"), "yesterday", std::chrono::hours(48)},
        {std::regex("this week|last 7 days"), "this week", std::chrono::hours(24 * 7)},
        {std::regex("last week"), "last week", std::chrono::hours(24 * 14)},
        {std::regex("this month"), "this month", std::chrono::hours(24 * 30)},
        {std::regex("last month"), "last month", std::chrono::hours(24 * 60)}
    };
    return patterns;
}

struct Category {
    std::string name;
    std::string label;
    std::vector<std::string> terms;
};

const std::vector<Category> CATEGORIES = {
    {"git", "Git operation",
     {"git", "commit", "branch", "merge", "push", "pull", "clone", "checkout", "rebase"}},
    {"network", "Network command",
     {"network", "curl", "wget", "ssh", "scp", "ping", "netstat", "download", "http"}},
    {"filesystem", "File operation",
     {"file", "files", "filesystem", "directory", "folder", "ls", "cd", "mkdir", "cp", "mv", "rm",
      "touch", "find"}},
    {"process", "Process management",
     {"process", "processes", "ps", "kill", "pkill", "top", "htop"}},
    {"package", "Package management",
     {"package", "packages", "install", "apt", "npm", "pip", "yarn", "brew"}},
    {"docker", "Container operation",
     {"docker", "container", "containers", "image", "compose", "kubectl"}}
};

const Category* findCategory(const std::string& name) {
    for (const auto& category : CATEGORIES) {
        if (category.name == name) return &category;
    }
    return nullptr;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

SearchMatch makeMatch(const std::string& command, double score, std::string match_type,
                      std::string reason, size_t position, const std::string& directory,
                      std::chrono::system_clock::time_point now) {
    SearchMatch match;
    match.command = command;
    match.score = score;
    match.match_type = std::move(match_type);
    match.reason = std::move(reason);
    match.timestamp = now - POSITION_AGE * static_cast<int>(position);
    match.directory = directory.empty() ? "~" : directory;
    return match;
}

} // anonymous namespace

HistorySearch::HistorySearch(InferenceAdapter* adapter, size_t cache_size)
    : adapter_(adapter), cache_(cache_size) {}

SearchResult HistorySearch::search(const std::string& query, const std::vector<std::string>& history,
                                   const std::string& directory) {
    if (trim(query).empty()) {
        SearchResult empty;
        empty.query = query;
        return empty;
    }

    std::string key = query + ":" + directory;
    if (auto cached = cache_.get(key)) {
        return *cached;
    }

    try {
        if (adapter_) {
            return remoteSearch(query, history, directory);
        }
        return localSearch(query, history, directory);
    } catch (const std::exception& e) {
        log::warn("search", std::string("history search failed, using substring match: ") + e.what());
        return basicSearch(query, history, directory);
    }
}

SearchResult HistorySearch::remoteSearch(const std::string& query, const std::vector<std::string>& history,
                                         const std::string& directory) {
    RemoteMatches remote;
    try {
        remote = adapter_->searchHistory(query, history, directory);
    } catch (const std::exception& e) {
        remote.success = false;
        remote.error = e.what();
    }

    if (!remote.success) {
        log::warn("search", "remote history search unavailable, searching locally: " + remote.error);
        return localSearch(query, history, directory);
    }

    SearchResult result;
    result.query = query;
    result.offline = false;
    result.timeframe = extractTimeframe(toLower(query));

    auto now = std::chrono::system_clock::now();
    for (const auto& match : remote.matches) {
        if (result.results.size() >= MAX_RESULTS) break;
        auto it = std::find(history.begin(), history.end(), match.command);
        size_t position = it == history.end() ? 0 : static_cast<size_t>(it - history.begin());
        result.results.push_back(makeMatch(match.command, match.score, match.match_type, match.reason,
                                           position, directory, now));
    }

    cache_.set(query + ":" + directory, result);
    return result;
}

SearchResult HistorySearch::localSearch(const std::string& query, const std::vector<std::string>& history,
                                        const std::string& directory) const {
    SearchResult result;
    result.query = query;

    std::string normalized = toLower(trim(query));
    std::vector<std::string> keywords = extractKeywords(normalized);
    std::vector<std::string> categories = extractCategories(normalized);
    result.timeframe = extractTimeframe(normalized);

    auto now = std::chrono::system_clock::now();
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < history.size(); ++i) {
        // History is newest first, so everything after this point is older still
        if (result.timeframe && POSITION_AGE * static_cast<int>(i) > result.timeframe->window) {
            break;
        }

        const std::string& command = history[i];
        std::string normalized_command = toLower(trim(command));
        if (normalized_command.empty() || !seen.insert(normalized_command).second) continue;

        double score = 0.0;
        bool matched = false;

        for (const auto& keyword : keywords) {
            if (contains(normalized_command, keyword)) {
                score += KEYWORD_SCORE;
                matched = true;
            }
        }

        if (normalized_command == normalized) {
            score += EXACT_SCORE;
            matched = true;
        } else if (startsWith(normalized_command, normalized)) {
            score += PREFIX_SCORE;
            matched = true;
        }

        for (const auto& category : categories) {
            if (isCommandInCategory(normalized_command, category)) {
                score += CATEGORY_SCORE;
                matched = true;
            }
        }

        // Recency only ranks entries that matched something
        if (!matched) continue;

        score += std::max(0.0, RECENCY_BOOST - static_cast<double>(i) * RECENCY_STEP);
        score = std::min(1.0, score);
        if (score <= MIN_SCORE) continue;

        result.results.push_back(makeMatch(
            command, score,
            searchMatchType(normalized_command, normalized, categories),
            searchMatchReason(normalized_command, normalized, categories, keywords),
            i, directory, now));
    }

    std::stable_sort(result.results.begin(), result.results.end(),
                     [](const SearchMatch& a, const SearchMatch& b) { return a.score > b.score; });
    if (result.results.size() > MAX_RESULTS) {
        result.results.resize(MAX_RESULTS);
    }

    return result;
}

SearchResult HistorySearch::basicSearch(const std::string& query, const std::vector<std::string>& history,
                                        const std::string& directory) const {
    SearchResult result;
    result.query = query;

    std::string normalized = toLower(trim(query));
    auto now = std::chrono::system_clock::now();

    for (size_t i = 0; i < history.size() && result.results.size() < MAX_RESULTS; ++i) {
        if (!contains(toLower(history[i]), normalized)) continue;

        double score = 1.0 - static_cast<double>(result.results.size()) * BASIC_STEP;
        result.results.push_back(makeMatch(history[i], score, "keyword",
                                           "Contains keyword \"" + trim(query) + "\"", i, directory, now));
    }

    return result;
}

std::vector<std::string> extractKeywords(const std::string& query) {
    std::vector<std::string> keywords;
    for (const auto& word : splitWhitespace(toLower(query))) {
        if (word.size() > 2 && STOP_WORDS.count(word) == 0 &&
            std::find(keywords.begin(), keywords.end(), word) == keywords.end()) {
            keywords.push_back(word);
        }
    }
    return keywords;
}

std::optional<Timeframe> extractTimeframe(const std::string& query) {
    std::string lower = toLower(query);
    for (const auto& pattern : timePatterns()) {
        if (std::regex_search(lower, pattern.matcher)) {
            return Timeframe{pattern.label, pattern.window};
        }
    }
    return std::nullopt;
}

std::vector<std::string> extractCategories(const std::string& query) {
    std::vector<std::string> words = splitWhitespace(toLower(query));
    std::vector<std::string> categories;

    for (const auto& category : CATEGORIES) {
        bool named = std::any_of(words.begin(), words.end(), [&](const std::string& word) {
            return std::find(category.terms.begin(), category.terms.end(), word) != category.terms.end();
        });
        if (named) {
            categories.push_back(category.name);
        }
    }

    return categories;
}

bool isCommandInCategory(const std::string& command, const std::string& category) {
    const Category* entry = findCategory(category);
    if (!entry) {
        return false;
    }

    for (const auto& word : splitWhitespace(toLower(command))) {
        if (std::find(entry->terms.begin(), entry->terms.end(), word) != entry->terms.end()) {
            return true;
        }
    }
    return false;
}

std::string searchMatchType(const std::string& command, const std::string& query,
                            const std::vector<std::string>& categories) {
    if (command == query) return "exact";
    if (startsWith(command, query)) return "prefix";

    for (const auto& category : categories) {
        if (isCommandInCategory(command, category)) return category;
    }

    if (contains(command, query)) return "substring";
    return "keyword";
}

std::string searchMatchReason(const std::string& command, const std::string& query,
                              const std::vector<std::string>& categories,
                              const std::vector<std::string>& keywords) {
    if (command == query) return "Exact match for your search";
    if (startsWith(command, query)) return "Starts with \"" + query + "\"";

    for (const auto& category : categories) {
        if (isCommandInCategory(command, category)) {
            const Category* entry = findCategory(category);
            return entry ? entry->label : "Related to " + category;
        }
    }

    if (contains(command, query)) return "Contains \"" + query + "\"";

    std::string matched;
    for (const auto& keyword : keywords) {
        if (!contains(command, keyword)) continue;
        if (!matched.empty()) matched += ", ";
        matched += "\"" + keyword + "\"";
    }
    return "Contains " + matched;
}

} // namespace hint
