/**
 * Suggestion.hpp - Suggestion records shared by every analyzer
 */

#pragma once

#include <string>
#include <variant>
#include <vector>

namespace hint {

enum class SuggestionSource {
    TYPO,
    SAFETY,
    SYNTAX,
    FUZZY,
    PATTERN,
    COMPLETION,     // Offline command/flag tables
    AI,
    FILE,
    GIT,
    NPM,
    PROCESS
};

enum class CorrectionKind {
    TYPO,
    SYNTAX,
    FUZZY
};

// Which history signal produced a pattern suggestion
enum class PatternOrigin {
    FREQUENCY,
    EXAMPLE,
    OPTIMIZATION,
    SEQUENCE
};

enum class ContextKind {
    FILE,
    GIT,
    NPM,
    PROCESS
};

struct CorrectionDetail {
    CorrectionKind kind;
};

struct DangerDetail {
    std::string warning;
};

struct PatternDetail {
    PatternOrigin origin;
    int count = 0;
    std::string original;       // OPTIMIZATION only
    std::string benefit_type;   // OPTIMIZATION only
};

struct CompletionDetail {
    std::string replacement;
};

struct ContextDetail {
    ContextKind kind;
};

struct AiDetail {};

using SuggestionDetail = std::variant<CorrectionDetail, DangerDetail, PatternDetail,
                                      CompletionDetail, ContextDetail, AiDetail>;

struct Suggestion {
    std::string command;
    std::string description;
    double score = 0.0;
    SuggestionDetail detail = AiDetail{};

    SuggestionSource source() const;
    bool isWarning() const;
    // "danger", "typo", "syntax", "fuzzy"; empty for everything else
    std::string type() const;
};

struct AnalyzeResult {
    std::vector<Suggestion> suggestions;
    bool has_warning = false;
};

// Terminal state passed with every request; position 0 of recent_commands is the newest
struct TerminalContext {
    std::string current_directory = "~";
    std::vector<std::string> recent_commands;
    std::string last_error;     // empty = none
};

std::string toString(SuggestionSource source);
std::string toString(PatternOrigin origin);

// Keeps the first suggestion for each command, in order; drops empty commands
std::vector<Suggestion> deduplicate(const std::vector<Suggestion>& suggestions);

} // namespace hint
