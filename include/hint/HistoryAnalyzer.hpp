/**
 * HistoryAnalyzer.hpp - Frequency, sequence and workflow-pattern analysis of command history
 */

#pragma once

#include "hint/FifoCache.hpp"
#include "hint/Suggestion.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace hint {

struct OptimizationTip {
    std::string from;
    std::string to;
    std::string benefit;
};

struct PatternDefinition {
    std::string name;
    std::regex matcher;
    std::string description;
    std::vector<OptimizationTip> tips;
};

struct ArgumentCount {
    std::string args;
    int count;
};

struct CommandFrequency {
    std::string command;    // base command
    int count;
    std::vector<ArgumentCount> popular_args;    // at most 3, most used first
};

struct CommandSequence {
    std::vector<std::string> commands;  // in history order (newest first)
    int count;
};

struct RecognizedPattern {
    std::string name;
    std::string description;
    std::vector<std::string> examples;
    int count;
    std::vector<OptimizationTip> optimization_tips;
};

struct Optimization {
    std::string original;
    std::string optimized;
    std::string explanation;
    std::string benefit_type;
};

// Parsed from the remote endpoint's pattern analysis (online mode only)
struct AiPattern {
    std::string pattern;
    std::string suggestion;
    std::string description;
};

struct AnalysisResult {
    std::vector<CommandFrequency> command_frequency;    // top 5
    std::vector<CommandSequence> command_sequences;     // top 3
    std::vector<RecognizedPattern> recognized_patterns;
    std::vector<Optimization> optimizations;
    std::vector<AiPattern> ai_patterns;
    std::chrono::system_clock::time_point timestamp;
};

class HistoryAnalyzer {
public:
    // depth: how many of the newest history entries are analyzed (and keyed)
    explicit HistoryAnalyzer(size_t depth = 20, size_t memo_size = 50);
    ~HistoryAnalyzer();

    // Memoized on (first `depth` entries, directory); never recomputes an identical pair
    std::shared_ptr<const AnalysisResult> analyze(const std::vector<std::string>& history,
                                                  const std::string& directory);

    // Input-scoped suggestions from an analysis, best first, at most 5
    std::vector<Suggestion> suggestionsFor(const std::string& input,
                                           const AnalysisResult& analysis,
                                           const std::string& last_command) const;

    // Number of analyses actually computed (memo misses)
    size_t computeCount() const { return compute_count_.load(); }

    // Age of the newest computed analysis; negative when none was computed yet
    long long secondsSinceLastAnalysis() const;

    const std::vector<PatternDefinition>& catalog() const { return patterns_; }

private:
    size_t depth_;
    std::vector<PatternDefinition> patterns_;
    FifoCache<std::shared_ptr<const AnalysisResult>> memo_;
    std::atomic<size_t> compute_count_{0};
    std::atomic<long long> last_analysis_ms_{-1};

    AnalysisResult compute(const std::vector<std::string>& history) const;

    std::vector<CommandFrequency> analyzeFrequency(const std::vector<std::string>& history) const;
    std::vector<CommandSequence> analyzeSequences(const std::vector<std::string>& history) const;
    std::vector<RecognizedPattern> recognizePatterns(const std::vector<std::string>& history) const;
    std::vector<Optimization> generateOptimizations(const std::vector<CommandFrequency>& frequencies,
                                                    const std::vector<CommandSequence>& sequences,
                                                    const std::vector<RecognizedPattern>& patterns) const;
};

// Initials for multi-word commands, otherwise the first three characters; lower-cased
std::string suggestAliasName(const std::string& command);

// Merged form of a known two-command shape; empty when the pair does not combine
std::string combineSequence(const std::vector<std::string>& commands);

} // namespace hint
