/**
 * CorrectionEngine.hpp - Typo, danger, syntax and fuzzy-name corrections
 */

#pragma once

#include "hint/Suggestion.hpp"

#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace hint {

enum class Severity {
    TYPO,
    SYNTAX,
    DANGER
};

struct CorrectionRule {
    std::string pattern;        // ECMAScript regex source, kept for diagnostics
    std::regex matcher;
    std::string replacement;    // corrected form ($1.. expand) or safe alternative; may be empty
    std::string explanation;
    Severity severity;
};

struct FuzzyMatch {
    std::string command;
    size_t distance;
};

class CorrectionEngine {
public:
    CorrectionEngine();
    ~CorrectionEngine();

    // At most one correction: typo, then danger, then syntax, then fuzzy
    std::optional<Suggestion> check(const std::string& command) const;

    bool isDangerous(const std::string& command) const;

    // Closest vocabulary entry within distance 3 (ties keep vocabulary order)
    std::optional<FuzzyMatch> closestCommand(const std::string& word) const;

private:
    struct TypoFix {
        std::string correction;
        std::string explanation;
    };

    std::unordered_map<std::string, TypoFix> typos_;
    std::vector<CorrectionRule> dangerous_rules_;
    std::vector<CorrectionRule> syntax_rules_;
    std::vector<std::string> vocabulary_;

    std::optional<Suggestion> checkTypo(const std::string& command) const;
    std::optional<Suggestion> checkDanger(const std::string& command) const;
    std::optional<Suggestion> checkSyntax(const std::string& command) const;
    std::optional<Suggestion> checkFuzzy(const std::string& command) const;
};

} // namespace hint
