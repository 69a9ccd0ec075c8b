/**
 * Suggestion.cpp - Suggestion records shared by every analyzer
 */

#include "hint/Suggestion.hpp"

#include <unordered_set>

namespace hint {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // anonymous namespace

SuggestionSource Suggestion::source() const {
    return std::visit(overloaded{
        [](const CorrectionDetail& d) {
            switch (d.kind) {
                case CorrectionKind::SYNTAX: return SuggestionSource::SYNTAX;
                case CorrectionKind::FUZZY:  return SuggestionSource::FUZZY;
                default:                     return SuggestionSource::TYPO;
            }
        },
        [](const DangerDetail&) { return SuggestionSource::SAFETY; },
        [](const PatternDetail&) { return SuggestionSource::PATTERN; },
        [](const CompletionDetail&) { return SuggestionSource::COMPLETION; },
        [](const ContextDetail& d) {
            switch (d.kind) {
                case ContextKind::GIT:     return SuggestionSource::GIT;
                case ContextKind::NPM:     return SuggestionSource::NPM;
                case ContextKind::PROCESS: return SuggestionSource::PROCESS;
                default:                   return SuggestionSource::FILE;
            }
        },
        [](const AiDetail&) { return SuggestionSource::AI; }
    }, detail);
}

bool Suggestion::isWarning() const {
    return std::holds_alternative<DangerDetail>(detail);
}

std::string Suggestion::type() const {
    if (isWarning()) return "danger";
    if (const auto* c = std::get_if<CorrectionDetail>(&detail)) {
        switch (c->kind) {
            case CorrectionKind::TYPO:   return "typo";
            case CorrectionKind::SYNTAX: return "syntax";
            case CorrectionKind::FUZZY:  return "fuzzy";
        }
    }
    return "";
}

std::string toString(SuggestionSource source) {
    switch (source) {
        case SuggestionSource::TYPO:       return "typo";
        case SuggestionSource::SAFETY:     return "safety";
        case SuggestionSource::SYNTAX:     return "syntax";
        case SuggestionSource::FUZZY:      return "fuzzy";
        case SuggestionSource::PATTERN:    return "pattern";
        case SuggestionSource::COMPLETION: return "completion";
        case SuggestionSource::AI:         return "ai";
        case SuggestionSource::FILE:       return "file";
        case SuggestionSource::GIT:        return "git";
        case SuggestionSource::NPM:        return "npm";
        case SuggestionSource::PROCESS:    return "process";
    }
    return "unknown";
}

std::string toString(PatternOrigin origin) {
    switch (origin) {
        case PatternOrigin::FREQUENCY:    return "frequency";
        case PatternOrigin::EXAMPLE:      return "pattern";
        case PatternOrigin::OPTIMIZATION: return "optimization";
        case PatternOrigin::SEQUENCE:     return "sequence";
    }
    return "unknown";
}

std::vector<Suggestion> deduplicate(const std::vector<Suggestion>& suggestions) {
    std::vector<Suggestion> result;
    std::unordered_set<std::string> seen;

    for (const auto& suggestion : suggestions) {
        if (suggestion.command.empty()) continue;
        if (seen.insert(suggestion.command).second) {
            result.push_back(suggestion);
        }
    }

    return result;
}

} // namespace hint
