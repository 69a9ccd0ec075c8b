/**
 * CorrectionEngine.cpp - Typo, danger, syntax and fuzzy-name corrections
 */

#include "hint/CorrectionEngine.hpp"
#include "hint/CommandParser.hpp"
#include "hint/EditDistance.hpp"
#include "hint/OfflineCatalog.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace hint {

namespace {

const size_t MAX_FUZZY_DISTANCE = 3;
const size_t MAX_LENGTH_DIFFERENCE = 3;

CorrectionRule makeRule(const std::string& pattern, const std::string& replacement,
                        const std::string& explanation, Severity severity) {
    return {pattern, std::regex(pattern), replacement, explanation, severity};
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

CorrectionEngine::CorrectionEngine() {
    typos_ = {
        {"cd..", {"cd ..", "Space required between cd and .."}},
        {"giit", {"git", "Typo in git command"}},
        {"gti", {"git", "Typo in git command"}},
        {"grpe", {"grep", "Typo in grep command"}},
        {"pythno", {"python", "Typo in python command"}},
        {"npmm", {"npm", "Typo in npm command"}},
        {"tra", {"tar", "Typo in tar command"}},
        {"cta", {"cat", "Typo in cat command"}},
        {"mkidr", {"mkdir", "Typo in mkdir command"}},
        {"touhc", {"touch", "Typo in touch command"}},
        {"suod", {"sudo", "Typo in sudo command"}},
        {"sl", {"ls", "Typo in ls command"}}
    };

    // Evaluated in order, first match wins
    dangerous_rules_ = {
        makeRule(R"(^(sudo\s+)?rm\s+-(rf|fr)\s+/\*?\s*$)", "",
                 "This command will delete your entire filesystem!", Severity::DANGER),
        makeRule(R"(^(sudo\s+)?rm\s+-(rf|fr)\s+(~|\$HOME)/?\*?\s*$)", "",
                 "This command will delete your home directory!", Severity::DANGER),
        makeRule(R"(^rm\s+-(rf|fr)\s+\.(/|/\*|\*)?\s*$)", "rm -rf ./specific-dir",
                 "This will delete the current directory and all contents", Severity::DANGER),
        makeRule(R"(^chmod\s+-R\s+777)", "chmod -R 755 for directories, 644 for files",
                 "Setting 777 permissions is a security risk", Severity::DANGER),
        makeRule(R"(^sudo\s+chmod\s+-R\s+777)", "sudo chmod -R 755 for directories, 644 for files",
                 "Setting 777 permissions is a security risk", Severity::DANGER),
        makeRule(R"(git\s+reset\s+--hard)", "git stash to preserve changes",
                 "This will discard all local changes!", Severity::DANGER),
        makeRule(R"(:\s*[wW][qQ]!)", ":w to save changes first",
                 "Force-quitting Vim without saving changes", Severity::DANGER),
        makeRule(R"(:\(\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;\s*:)", "",
                 "Fork bomb: this will exhaust system processes", Severity::DANGER),
        makeRule(R"(^(sudo\s+)?(dd\s+.*of=/dev/(sd|nvme|hd)|mkfs))", "",
                 "This writes directly to a disk device and destroys its data", Severity::DANGER)
    };

    syntax_rules_ = {
        makeRule(R"(^cd\s+([^\s]+)\s+([^\s]+))", "cd $1",
                 "cd only takes one directory argument", Severity::SYNTAX),
        makeRule(R"(^git\s+commit\s+([^-].*))", "git commit -m \"$1\"",
                 "Missing -m flag for commit message", Severity::SYNTAX),
        makeRule(R"(^git\s+add\s+(\S+)\s+git\s+commit)", "git add $1 && git commit",
                 "Use && between commands", Severity::SYNTAX),
        makeRule(R"(^find\s+(\S+)\s+-name\s+([^"'\s]*[*?][^"'\s]*)\s*$)", "find $1 -name \"$2\"",
                 "The -name argument needs a pattern in quotes", Severity::SYNTAX)
    };

    for (const auto& entry : basicCommands()) {
        vocabulary_.push_back(entry.first);
    }
}

CorrectionEngine::~CorrectionEngine() = default;

std::optional<Suggestion> CorrectionEngine::check(const std::string& command) const {
    std::string trimmed = trim(command);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    if (auto typo = checkTypo(trimmed)) return typo;
    if (auto danger = checkDanger(trimmed)) return danger;
    if (auto syntax = checkSyntax(trimmed)) return syntax;
    return checkFuzzy(trimmed);
}

bool CorrectionEngine::isDangerous(const std::string& command) const {
    return checkDanger(trim(command)).has_value();
}

std::optional<Suggestion> CorrectionEngine::checkTypo(const std::string& command) const {
    auto it = typos_.find(command);
    if (it != typos_.end()) {
        return Suggestion{it->second.correction, it->second.explanation, 0.98,
                          CorrectionDetail{CorrectionKind::TYPO}};
    }

    // Typo in the command name only: keep the arguments
    size_t space = command.find(' ');
    if (space == std::string::npos) {
        return std::nullopt;
    }

    it = typos_.find(command.substr(0, space));
    if (it == typos_.end()) {
        return std::nullopt;
    }

    return Suggestion{it->second.correction + command.substr(space), it->second.explanation, 0.98,
                      CorrectionDetail{CorrectionKind::TYPO}};
}

std::optional<Suggestion> CorrectionEngine::checkDanger(const std::string& command) const {
    for (const auto& rule : dangerous_rules_) {
        if (std::regex_search(command, rule.matcher)) {
            std::string target = rule.replacement.empty() ? command : rule.replacement;
            return Suggestion{target, "⚠️ " + rule.explanation, 0.99,
                              DangerDetail{rule.explanation}};
        }
    }
    return std::nullopt;
}

std::optional<Suggestion> CorrectionEngine::checkSyntax(const std::string& command) const {
    for (const auto& rule : syntax_rules_) {
        std::smatch match;
        if (std::regex_search(command, match, rule.matcher)) {
            return Suggestion{match.format(rule.replacement), rule.explanation, 0.97,
                              CorrectionDetail{CorrectionKind::SYNTAX}};
        }
    }
    return std::nullopt;
}

std::optional<Suggestion> CorrectionEngine::checkFuzzy(const std::string& command) const {
    size_t space = command.find(' ');
    std::string first_word = command.substr(0, space);

    if (first_word.size() < 2) {
        return std::nullopt;
    }

    auto match = closestCommand(first_word);
    if (!match || match->command == first_word) {
        return std::nullopt;
    }

    std::string corrected = match->command;
    if (space != std::string::npos) {
        corrected += command.substr(space);
    }

    return Suggestion{corrected, "Did you mean '" + match->command + "'?", 0.96,
                      CorrectionDetail{CorrectionKind::FUZZY}};
}

std::optional<FuzzyMatch> CorrectionEngine::closestCommand(const std::string& word) const {
    if (word.size() < 2) {
        return std::nullopt;
    }

    std::string lower = toLower(word);
    std::optional<FuzzyMatch> best;
    size_t min_distance = std::numeric_limits<size_t>::max();

    for (const auto& candidate : vocabulary_) {
        size_t diff = candidate.size() > lower.size() ? candidate.size() - lower.size()
                                                      : lower.size() - candidate.size();
        if (diff > MAX_LENGTH_DIFFERENCE) continue;

        size_t distance = editDistance(lower, toLower(candidate));
        if (distance < min_distance && distance <= MAX_FUZZY_DISTANCE) {
            min_distance = distance;
            best = FuzzyMatch{candidate, distance};
        }
    }

    return best;
}

} // namespace hint
