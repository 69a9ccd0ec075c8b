/**
 * SuggestionEngine.cpp - Combines corrections, history patterns, offline tables and the remote endpoint
 */

#include "hint/SuggestionEngine.hpp"
#include "hint/ContextProvider.hpp"
#include "hint/InferenceClient.hpp"
#include "hint/Log.hpp"
#include "hint/OfflineCatalog.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <optional>

namespace hint {

namespace {

// Offline heuristics beyond this many are dropped before merging
constexpr size_t MAX_OFFLINE_HEURISTICS = 5;

constexpr double COMPLETION_SCORE = 0.6;
constexpr double FILE_SCORE = 0.5;

void append(std::vector<Suggestion>& target, const std::vector<Suggestion>& source) {
    target.insert(target.end(), source.begin(), source.end());
}

} // anonymous namespace

SuggestionEngine::SuggestionEngine(const EngineConfig& config,
                                   InferenceClient* client,
                                   ContextProvider* provider)
    : config_(config),
      offline_(config.isOffline() || client == nullptr),
      provider_(provider),
      cache_(config.cache_size),
      analyzer_(config.history_depth),
      adapter_(offline_ ? nullptr : std::make_unique<InferenceAdapter>(*client)),
      explainer_(cache_, adapter_.get()),
      search_(adapter_.get(), config.cache_size) {
    log::debug("engine", offline_ ? "running offline" : "running online, model " + config_.model);
}

SuggestionEngine::~SuggestionEngine() = default;

AnalyzeResult SuggestionEngine::analyze(const std::string& input, const TerminalContext& context) {
    if (trim(input).size() < std::max<size_t>(config_.min_input_length, 1)) {
        return {};
    }

    std::string key = SuggestionCache::suggestionKey(input, context.current_directory);
    if (auto cached = cache_.get(key)) {
        if (auto* result = std::get_if<AnalyzeResult>(&*cached)) {
            return *result;
        }
    }

    try {
        bool fell_back = false;
        AnalyzeResult result = compute(input, context, fell_back);
        // An offline fallback stands in for one call; the next one retries the endpoint
        if (!fell_back) {
            cache_.set(key, result);
        }
        return result;
    } catch (const std::exception& e) {
        log::error("engine", "analysis of '" + input + "' failed: " + e.what());
        return {};
    }
}

AnalyzeResult SuggestionEngine::compute(const std::string& input, const TerminalContext& context,
                                        bool& fell_back) {
    std::optional<Suggestion> correction;
    try {
        correction = corrections_.check(input);
    } catch (const std::exception& e) {
        log::warn("engine", std::string("correction check failed: ") + e.what());
    }

    // A dangerous command is reported alone, whatever else applies
    if (correction && correction->isWarning()) {
        AnalyzeResult result;
        result.suggestions.push_back(*correction);
        result.has_warning = true;
        return result;
    }

    std::vector<Suggestion> patterns = patternSuggestions(input, context);

    AnalyzeResult result;
    if (!offline_) {
        RemoteSuggestions remote;
        try {
            remote = adapter_->suggest(input, context);
        } catch (const std::exception& e) {
            remote.success = false;
            remote.error = e.what();
        }

        if (remote.success) {
            std::vector<Suggestion> combined = patterns;
            append(combined, remote.suggestions);
            result.suggestions = finish(combined);
            return result;
        }
        log::warn("engine", "remote suggestions unavailable, using offline heuristics: " + remote.error);
        fell_back = true;
    }

    std::vector<Suggestion> combined;
    if (correction) combined.push_back(*correction);
    append(combined, patterns);
    append(combined, offlineSuggestions(input, context));
    result.suggestions = finish(combined);
    return result;
}

std::vector<Suggestion> SuggestionEngine::patternSuggestions(const std::string& input,
                                                             const TerminalContext& context) {
    if (context.recent_commands.empty()) {
        return {};
    }

    try {
        auto analysis = analyzer_.analyze(context.recent_commands, context.current_directory);
        return analyzer_.suggestionsFor(input, *analysis, context.recent_commands.front());
    } catch (const std::exception& e) {
        log::warn("engine", std::string("history analysis failed: ") + e.what());
        return {};
    }
}

std::vector<Suggestion> SuggestionEngine::offlineSuggestions(const std::string& input,
                                                             const TerminalContext& context) {
    std::vector<Suggestion> suggestions;

    std::string command = trim(input);
    ParsedCommand parsed = parser_.parse(command);
    const auto& tokens = parsed.tokens;
    if (tokens.empty()) {
        return suggestions;
    }

    bool sudo = parsed.executable == "sudo" && tokens.size() > 1;
    bool naming_command = tokens.size() == 1 || (sudo && tokens.size() == 2);
    std::string base = sudo ? tokens[1].text : parsed.executable;
    const CommandToken& last_token = tokens.back();
    const std::string& last = last_token.text;

    if (naming_command) {
        for (const auto& entry : basicCommands()) {
            if (entry.first != last && startsWith(entry.first, last)) {
                Suggestion s;
                s.command = replaceLastToken(command, last, entry.first);
                s.description = entry.second;
                s.score = COMPLETION_SCORE;
                s.detail = CompletionDetail{entry.first};
                suggestions.push_back(s);
            }
        }
    } else if (last_token.kind == TokenKind::FLAG) {
        for (const auto& entry : flagsFor(base)) {
            if (entry.first != last && startsWith(entry.first, last)) {
                Suggestion s;
                s.command = replaceLastToken(command, last, entry.first);
                s.description = entry.second;
                s.score = COMPLETION_SCORE;
                s.detail = CompletionDetail{entry.first};
                suggestions.push_back(s);
            }
        }
    } else if (provider_ && last_token.kind == TokenKind::PATH) {
        try {
            for (const auto& candidate : provider_->candidates(ContextKind::FILE, last,
                                                               context.current_directory)) {
                if (candidate.value == last) continue;
                Suggestion s;
                s.command = replaceLastToken(command, last, candidate.value);
                s.description = candidate.description;
                s.score = FILE_SCORE;
                s.detail = ContextDetail{ContextKind::FILE};
                suggestions.push_back(s);
            }
        } catch (const std::exception& e) {
            log::warn("engine", std::string("file completion failed: ") + e.what());
        }
    }

    if (suggestions.size() > MAX_OFFLINE_HEURISTICS) {
        suggestions.resize(MAX_OFFLINE_HEURISTICS);
    }
    return suggestions;
}

std::vector<Suggestion> SuggestionEngine::finish(const std::vector<Suggestion>& combined) const {
    std::vector<Suggestion> unique = deduplicate(combined);
    if (unique.size() > config_.max_suggestions) {
        unique.resize(config_.max_suggestions);
    }
    return unique;
}

Explanation SuggestionEngine::explain(const std::string& command) {
    try {
        return explainer_.explain(command);
    } catch (const std::exception& e) {
        log::error("engine", "explanation of '" + command + "' failed: " + e.what());
        return offlineExplanation(baseCommand(command));
    }
}

AnalysisResult SuggestionEngine::analyzePatterns(const std::vector<std::string>& history,
                                                 const TerminalContext& context) {
    AnalysisResult empty;
    empty.timestamp = std::chrono::system_clock::now();
    if (history.size() < 2) {
        return empty;
    }

    std::shared_ptr<const AnalysisResult> local;
    try {
        local = analyzer_.analyze(history, context.current_directory);
    } catch (const std::exception& e) {
        log::warn("engine", std::string("pattern analysis failed: ") + e.what());
        return empty;
    }

    if (offline_) {
        return *local;
    }

    // Only the analyzed slice takes part in the key, matching the analyzer memo
    std::vector<std::string> slice(history.begin(),
                                   history.begin() + std::min(history.size(), config_.history_depth));
    std::string key = SuggestionCache::patternKey(context.current_directory, slice);
    if (auto cached = cache_.get(key)) {
        if (auto* result = std::get_if<AnalysisResult>(&*cached)) {
            return *result;
        }
    }

    RemotePatterns remote;
    try {
        remote = adapter_->analyzePatterns(slice, local->optimizations);
    } catch (const std::exception& e) {
        remote.success = false;
        remote.error = e.what();
    }
    if (!remote.success) {
        log::warn("engine", "remote pattern analysis unavailable: " + remote.error);
        return *local;
    }

    AnalysisResult enriched = *local;
    enriched.ai_patterns = remote.patterns;
    cache_.set(key, enriched);
    return enriched;
}

SearchResult SuggestionEngine::searchHistory(const std::string& query, const std::vector<std::string>& history,
                                             const TerminalContext& context) {
    return search_.search(query, history, context.current_directory);
}

void SuggestionEngine::clearCache() {
    cache_.clear();
    search_.clear();
    log::debug("engine", "cache cleared");
}

size_t SuggestionEngine::clearCacheByPrefix(const std::string& prefix) {
    size_t removed = cache_.clearByPrefix(prefix);
    log::debug("engine", "removed " + std::to_string(removed) + " entries with prefix '" + prefix + "'");
    return removed;
}

CacheStats SuggestionEngine::getCacheStats() const {
    CacheStats stats;
    stats.size = cache_.size();
    stats.max_size = cache_.maxSize();
    stats.categories = cache_.categoryCounts();
    stats.pattern_analysis_age_seconds = analyzer_.secondsSinceLastAnalysis();
    return stats;
}

} // namespace hint
