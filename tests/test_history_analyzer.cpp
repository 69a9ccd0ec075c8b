/**
 * test_history_analyzer.cpp - Unit tests for HistoryAnalyzer
 */

#include "hint/HistoryAnalyzer.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

const hint::PatternDetail& patternDetail(const hint::Suggestion& s) {
    return std::get<hint::PatternDetail>(s.detail);
}

} // anonymous namespace

void test_mkdir_cd_optimization() {
    hint::HistoryAnalyzer analyzer;
    std::vector<std::string> history = {
        "mkdir proj", "cd proj", "mkdir proj", "cd proj", "mkdir proj", "cd proj"
    };

    auto analysis = analyzer.analyze(history, "~");

    auto found = std::find_if(analysis->optimizations.begin(), analysis->optimizations.end(),
                              [](const hint::Optimization& o) {
                                  return o.optimized.find("mkdir -p proj && cd $_") != std::string::npos;
                              });
    assert(found != analysis->optimizations.end());
    assert(found->original == "mkdir proj && cd proj");
    assert(found->benefit_type == "efficiency");

    std::cout << "[PASS] test_mkdir_cd_optimization\n";
}

void test_command_frequency() {
    hint::HistoryAnalyzer analyzer;
    std::vector<std::string> history = {"git status", "ls -la", "git status", "git push"};

    auto analysis = analyzer.analyze(history, "~");

    assert(analysis->command_frequency.size() == 2);
    const auto& git = analysis->command_frequency[0];
    assert(git.command == "git");
    assert(git.count == 3);
    assert(git.popular_args.size() == 2);
    assert(git.popular_args[0].args == "status");
    assert(git.popular_args[0].count == 2);
    assert(analysis->command_frequency[1].command == "ls");

    std::cout << "[PASS] test_command_frequency\n";
}

void test_frequency_truncated_to_top_five() {
    hint::HistoryAnalyzer analyzer;
    std::vector<std::string> history = {"a1 x", "a2 x", "a3 x", "a4 x", "a5 x", "a6 x", "a7 x"};

    auto analysis = analyzer.analyze(history, "~");

    assert(analysis->command_frequency.size() == 5);
    // Equal counts keep first-seen order
    assert(analysis->command_frequency[0].command == "a1");
    assert(analysis->command_frequency[4].command == "a5");

    std::cout << "[PASS] test_frequency_truncated_to_top_five\n";
}

void test_recognized_patterns() {
    hint::HistoryAnalyzer analyzer;
    std::vector<std::string> history = {"git checkout main", "git pull", "grep -r TODO src", "git checkout main"};

    auto analysis = analyzer.analyze(history, "~");

    assert(!analysis->recognized_patterns.empty());
    const auto& git = analysis->recognized_patterns[0];
    assert(git.name == "git-operations");
    assert(git.count == 3);
    assert(git.examples.size() == 2);

    bool has_switch = false;
    bool has_rg = false;
    for (const auto& opt : analysis->optimizations) {
        if (opt.optimized == "git switch main") has_switch = true;
        if (opt.optimized == "rg TODO src") has_rg = true;
    }
    assert(has_switch);
    assert(has_rg);

    std::cout << "[PASS] test_recognized_patterns\n";
}

void test_memoized_analysis() {
    hint::HistoryAnalyzer analyzer;
    std::vector<std::string> history = {"ls", "cd src", "ls"};

    assert(analyzer.secondsSinceLastAnalysis() < 0);

    auto first = analyzer.analyze(history, "/home/user");
    auto second = analyzer.analyze(history, "/home/user");

    assert(analyzer.computeCount() == 1);
    assert(first == second);
    assert(analyzer.secondsSinceLastAnalysis() >= 0);

    analyzer.analyze(history, "/tmp");
    assert(analyzer.computeCount() == 2);

    std::cout << "[PASS] test_memoized_analysis\n";
}

void test_only_depth_entries_are_keyed() {
    hint::HistoryAnalyzer analyzer(3);

    analyzer.analyze({"ls", "pwd", "ls", "git status"}, "~");
    analyzer.analyze({"ls", "pwd", "ls", "make"}, "~");

    assert(analyzer.computeCount() == 1);

    std::cout << "[PASS] test_only_depth_entries_are_keyed\n";
}

void test_blank_entries_skipped() {
    hint::HistoryAnalyzer analyzer;

    auto analysis = analyzer.analyze({"", "   ", "ls"}, "~");

    assert(analysis->command_frequency.size() == 1);
    assert(analysis->command_frequency[0].command == "ls");

    std::cout << "[PASS] test_blank_entries_skipped\n";
}

void test_suggestions_ranked_with_stable_ties() {
    hint::HistoryAnalyzer analyzer;
    std::vector<std::string> history = {"git status", "git status", "git push"};

    auto analysis = analyzer.analyze(history, "~");
    auto suggestions = analyzer.suggestionsFor("gi", *analysis, history[0]);

    // Examples (0.8) in discovery order, then the frequency entry; argument duplicates dropped
    assert(suggestions.size() == 3);
    assert(suggestions[0].command == "git status");
    assert(patternDetail(suggestions[0]).origin == hint::PatternOrigin::EXAMPLE);
    assert(suggestions[1].command == "git push");
    assert(suggestions[2].command == "git");
    assert(patternDetail(suggestions[2]).origin == hint::PatternOrigin::FREQUENCY);
    assert(patternDetail(suggestions[2]).count == 3);
    for (const auto& s : suggestions) {
        assert(s.source() == hint::SuggestionSource::PATTERN);
    }

    std::cout << "[PASS] test_suggestions_ranked_with_stable_ties\n";
}

void test_next_command_from_sequence() {
    hint::HistoryAnalyzer analyzer;
    // Newest first: the user keeps running "git push" right after committing
    std::vector<std::string> history = {
        "git commit -m x", "git push", "git commit -m x", "git push", "git commit -m x"
    };

    auto analysis = analyzer.analyze(history, "~");
    auto suggestions = analyzer.suggestionsFor("git p", *analysis, history[0]);

    assert(suggestions.size() == 1);
    assert(suggestions[0].command == "git push");
    assert(suggestions[0].score == 0.95);
    assert(patternDetail(suggestions[0]).origin == hint::PatternOrigin::SEQUENCE);

    std::cout << "[PASS] test_next_command_from_sequence\n";
}

void test_optimization_suggestion() {
    hint::HistoryAnalyzer analyzer;
    std::vector<std::string> history = {
        "mkdir proj", "cd proj", "mkdir proj", "cd proj", "mkdir proj", "cd proj"
    };

    auto analysis = analyzer.analyze(history, "~");
    auto suggestions = analyzer.suggestionsFor("mkdir", *analysis, history[0]);

    auto found = std::find_if(suggestions.begin(), suggestions.end(), [](const hint::Suggestion& s) {
        return s.command == "mkdir -p proj && cd $_";
    });
    assert(found != suggestions.end());
    assert(patternDetail(*found).origin == hint::PatternOrigin::OPTIMIZATION);
    assert(patternDetail(*found).original == "mkdir proj && cd proj");

    std::cout << "[PASS] test_optimization_suggestion\n";
}

void test_combine_and_alias_helpers() {
    assert(hint::combineSequence({"cd src", "ls"}) == "ls src");
    assert(hint::combineSequence({"mkdir out", "cd out"}) == "mkdir -p out && cd $_");
    assert(hint::combineSequence({"mkdir out", "cd elsewhere"}).empty());
    assert(hint::combineSequence({"git add .", "git commit -m \"wip\""}) == "git commit -am \"wip\"");
    assert(hint::combineSequence({"ls", "pwd"}).empty());
    assert(hint::combineSequence({"cd a", "ls", "pwd"}).empty());

    assert(hint::suggestAliasName("docker compose up") == "dcu");
    assert(hint::suggestAliasName("kubectl") == "kub");

    std::cout << "[PASS] test_combine_and_alias_helpers\n";
}

int main() {
    std::cout << "Running HistoryAnalyzer tests...\n\n";

    test_mkdir_cd_optimization();
    test_command_frequency();
    test_frequency_truncated_to_top_five();
    test_recognized_patterns();
    test_memoized_analysis();
    test_only_depth_entries_are_keyed();
    test_blank_entries_skipped();
    test_suggestions_ranked_with_stable_ties();
    test_next_command_from_sequence();
    test_optimization_suggestion();
    test_combine_and_alias_helpers();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
