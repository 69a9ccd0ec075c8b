/**
 * InferenceAdapter.hpp - Prompts for the remote endpoint and parsing of its replies
 */

#pragma once

#include "hint/Explanation.hpp"
#include "hint/HistoryAnalyzer.hpp"
#include "hint/InferenceClient.hpp"
#include "hint/Suggestion.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hint {

struct RemoteSuggestions {
    std::vector<Suggestion> suggestions;
    bool success = false;
    std::string error;
};

struct RemoteText {
    std::string content;
    bool success = false;
    std::string error;
};

struct RemotePatterns {
    std::vector<AiPattern> patterns;
    bool success = false;
    std::string error;
};

// One history entry the endpoint judged relevant to a search query
struct RemoteMatch {
    std::string command;
    double score = 0.5;
    std::string match_type = "unknown";
    std::string reason = "Matches search criteria";
};

struct RemoteMatches {
    std::vector<RemoteMatch> matches;
    bool success = false;
    std::string error;
};

class InferenceAdapter {
public:
    explicit InferenceAdapter(InferenceClient& client);
    ~InferenceAdapter();

    RemoteSuggestions suggest(const std::string& input, const TerminalContext& context);
    RemoteText explain(const std::string& command);
    // Raw reply; the caller parses it with parseStructuredExplanation
    RemoteText explainStructured(const std::string& command);
    RemotePatterns analyzePatterns(const std::vector<std::string>& history,
                                   const std::vector<Optimization>& local_optimizations);
    // A reply that is not valid search JSON counts as a failure
    RemoteMatches searchHistory(const std::string& query, const std::vector<std::string>& history,
                                const std::string& directory);

    static std::string buildSuggestionPrompt(const std::string& input, const TerminalContext& context);
    // Free-text explanation request, also streamed by the CLI
    static InferenceRequest explainRequest(const std::string& command);

private:
    InferenceClient& client_;
};

// "label: explanation" lines (optionally numbered or bulleted); other lines are dropped
std::vector<Suggestion> parseSuggestionLines(const std::string& content);

// JSON object, bare or inside a ``` fence; nullopt when malformed or missing command/purpose
std::optional<StructuredExplanation> parseStructuredExplanation(const std::string& content);

// {"results": [{command, score, matchType, reason}, ...]} (or a bare array), bare or fenced;
// entries without a command are skipped, missing fields keep their defaults
std::optional<std::vector<RemoteMatch>> parseSearchMatches(const std::string& content);

// "Pattern: name" headings followed by "Suggestion: command: description" lines, at most 5
std::vector<AiPattern> parsePatternLines(const std::string& content);

} // namespace hint
