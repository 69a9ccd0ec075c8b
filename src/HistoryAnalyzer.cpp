/**
 * HistoryAnalyzer.cpp - Frequency, sequence and workflow-pattern analysis of command history
 */

#include "hint/HistoryAnalyzer.hpp"
#include "hint/CommandParser.hpp"
#include "hint/Log.hpp"

#include <algorithm>
#include <cctype>
#include <map>

#include <nlohmann/json.hpp>

namespace hint {

namespace {

const size_t TOP_FREQUENCIES = 5;
const size_t TOP_SEQUENCES = 3;
const size_t MAX_POPULAR_ARGS = 3;
const size_t MAX_PATTERN_SUGGESTIONS = 5;
const int ALIAS_MIN_COUNT = 3;
const size_t ALIAS_MIN_LENGTH = 10;

const double SEQUENCE_SCORE = 0.95;
const double FREQUENCY_SCORE = 0.9;
const double ARGUMENT_SCORE = 0.85;
const double EXAMPLE_SCORE = 0.8;
const double OPTIMIZATION_SCORE = 0.75;

PatternDefinition definePattern(const std::string& name, const std::string& regex,
                                const std::string& description, std::vector<OptimizationTip> tips) {
    return {name, std::regex(regex), description, std::move(tips)};
}

long long nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string memoKey(const std::vector<std::string>& slice, const std::string& directory) {
    nlohmann::json key = {{"commands", slice}, {"contextDir", directory}};
    return key.dump();
}

double frequencyScore(double weight, int count) {
    return std::min(weight, weight * (count / 10.0));
}

} // anonymous namespace

HistoryAnalyzer::HistoryAnalyzer(size_t depth, size_t memo_size)
    : depth_(depth == 0 ? 1 : depth), memo_(memo_size) {
    patterns_.push_back(definePattern("file-search", R"(^(find|grep|ack|ag|rg)\s.+)",
        "File content search",
        {{"grep -r", "rg", "speed"}, {"find . -name", "fd", "simplicity"}}));
    patterns_.push_back(definePattern("file-navigation", R"(^(cd|pushd|popd)\s.+)",
        "Directory navigation",
        {{"cd ..; cd ..", "cd ../..", "brevity"}}));
    patterns_.push_back(definePattern("file-operations", R"(^(cp|mv|rm|mkdir)\s.+)",
        "File operations",
        {{"mkdir dir && cd dir", "mkdir -p dir && cd $_", "efficiency"}}));
    patterns_.push_back(definePattern("git-operations", R"(^git\s.+)",
        "Git operations",
        {{"git add . && git commit -m", "git commit -am", "brevity"},
         {"git checkout", "git switch", "modern"}}));
    patterns_.push_back(definePattern("package-management", R"(^(apt|yum|brew|npm|pip|cargo)\s.+)",
        "Package management",
        {{"npm install", "npm i", "brevity"},
         {"apt-get update && apt-get upgrade", "apt update && apt upgrade", "modern"}}));
    patterns_.push_back(definePattern("process-management", R"(^(ps|kill|pkill|top|htop)\s.+)",
        "Process management",
        {{"ps aux | grep", "pgrep", "simplicity"}}));
    patterns_.push_back(definePattern("permission-operations", R"(^(chmod|chown|sudo)\s.+)",
        "Permission operations",
        {{"chmod +x", "chmod 755", "explicitness"}}));
}

HistoryAnalyzer::~HistoryAnalyzer() = default;

std::shared_ptr<const AnalysisResult> HistoryAnalyzer::analyze(const std::vector<std::string>& history,
                                                               const std::string& directory) {
    std::vector<std::string> slice(history.begin(),
                                   history.begin() + std::min(depth_, history.size()));
    std::string key = memoKey(slice, directory);

    if (auto cached = memo_.get(key)) {
        return *cached;
    }

    auto result = std::make_shared<const AnalysisResult>(compute(slice));
    memo_.set(key, result);

    compute_count_++;
    last_analysis_ms_ = nowMillis();
    log::debug("history", "analyzed " + std::to_string(slice.size()) + " commands");

    return result;
}

long long HistoryAnalyzer::secondsSinceLastAnalysis() const {
    long long last = last_analysis_ms_.load();
    if (last < 0) return -1;
    return (nowMillis() - last) / 1000;
}

AnalysisResult HistoryAnalyzer::compute(const std::vector<std::string>& history) const {
    std::vector<std::string> commands;
    for (const auto& entry : history) {
        std::string cmd = trim(entry);
        if (cmd.empty()) {
            log::debug("history", "skipping blank history entry");
            continue;
        }
        commands.push_back(cmd);
    }

    auto frequencies = analyzeFrequency(commands);
    auto sequences = analyzeSequences(commands);
    auto patterns = recognizePatterns(commands);

    AnalysisResult result;
    result.optimizations = generateOptimizations(frequencies, sequences, patterns);
    result.recognized_patterns = std::move(patterns);

    if (frequencies.size() > TOP_FREQUENCIES) frequencies.resize(TOP_FREQUENCIES);
    if (sequences.size() > TOP_SEQUENCES) sequences.resize(TOP_SEQUENCES);
    result.command_frequency = std::move(frequencies);
    result.command_sequences = std::move(sequences);
    result.timestamp = std::chrono::system_clock::now();

    return result;
}

std::vector<CommandFrequency> HistoryAnalyzer::analyzeFrequency(const std::vector<std::string>& history) const {
    struct Tally {
        std::string command;
        int count = 0;
        std::vector<ArgumentCount> args;    // first-seen order
    };

    std::vector<Tally> tallies;
    std::map<std::string, size_t> position;

    for (const auto& cmd : history) {
        std::string base = baseCommand(cmd);

        auto found = position.find(base);
        if (found == position.end()) {
            found = position.emplace(base, tallies.size()).first;
            tallies.push_back({base, 0, {}});
        }

        Tally& tally = tallies[found->second];
        tally.count++;

        std::string args = trim(cmd.substr(base.size()));
        if (args.empty()) continue;

        auto arg = std::find_if(tally.args.begin(), tally.args.end(),
                                [&](const ArgumentCount& a) { return a.args == args; });
        if (arg == tally.args.end()) {
            tally.args.push_back({args, 1});
        } else {
            arg->count++;
        }
    }

    std::stable_sort(tallies.begin(), tallies.end(),
                     [](const Tally& a, const Tally& b) { return a.count > b.count; });

    std::vector<CommandFrequency> result;
    for (auto& tally : tallies) {
        std::stable_sort(tally.args.begin(), tally.args.end(),
                         [](const ArgumentCount& a, const ArgumentCount& b) { return a.count > b.count; });
        if (tally.args.size() > MAX_POPULAR_ARGS) tally.args.resize(MAX_POPULAR_ARGS);
        result.push_back({tally.command, tally.count, std::move(tally.args)});
    }

    return result;
}

std::vector<CommandSequence> HistoryAnalyzer::analyzeSequences(const std::vector<std::string>& history) const {
    std::vector<CommandSequence> sequences;
    std::map<std::vector<std::string>, size_t> position;

    for (size_t length = 2; length <= 3; ++length) {
        if (history.size() < length) continue;

        for (size_t i = 0; i + length <= history.size(); ++i) {
            std::vector<std::string> window(history.begin() + i, history.begin() + i + length);

            auto found = position.find(window);
            if (found == position.end()) {
                position.emplace(window, sequences.size());
                sequences.push_back({std::move(window), 1});
            } else {
                sequences[found->second].count++;
            }
        }
    }

    sequences.erase(std::remove_if(sequences.begin(), sequences.end(),
                                   [](const CommandSequence& s) { return s.count < 2; }),
                    sequences.end());
    std::stable_sort(sequences.begin(), sequences.end(),
                     [](const CommandSequence& a, const CommandSequence& b) { return a.count > b.count; });

    return sequences;
}

std::vector<RecognizedPattern> HistoryAnalyzer::recognizePatterns(const std::vector<std::string>& history) const {
    std::vector<RecognizedPattern> recognized;

    for (const auto& cmd : history) {
        for (const auto& pattern : patterns_) {
            if (!std::regex_search(cmd, pattern.matcher)) continue;

            auto existing = std::find_if(recognized.begin(), recognized.end(),
                                         [&](const RecognizedPattern& p) { return p.name == pattern.name; });
            if (existing == recognized.end()) {
                recognized.push_back({pattern.name, pattern.description, {cmd}, 1, pattern.tips});
                continue;
            }

            if (std::find(existing->examples.begin(), existing->examples.end(), cmd) == existing->examples.end()) {
                existing->examples.push_back(cmd);
            }
            existing->count++;
        }
    }

    std::stable_sort(recognized.begin(), recognized.end(),
                     [](const RecognizedPattern& a, const RecognizedPattern& b) { return a.count > b.count; });

    return recognized;
}

std::vector<Optimization> HistoryAnalyzer::generateOptimizations(const std::vector<CommandFrequency>& frequencies,
                                                                 const std::vector<CommandSequence>& sequences,
                                                                 const std::vector<RecognizedPattern>& patterns) const {
    std::vector<Optimization> optimizations;

    for (const auto& pattern : patterns) {
        for (const auto& tip : pattern.optimization_tips) {
            for (const auto& example : pattern.examples) {
                size_t pos = example.find(tip.from);
                if (pos == std::string::npos) continue;

                std::string optimized = example;
                optimized.replace(pos, tip.from.size(), tip.to);
                optimizations.push_back({
                    example,
                    optimized,
                    "Use '" + tip.to + "' instead of '" + tip.from + "' for better " + tip.benefit + ".",
                    tip.benefit
                });
            }
        }
    }

    for (const auto& freq : frequencies) {
        if (freq.count < ALIAS_MIN_COUNT || freq.command.size() <= ALIAS_MIN_LENGTH) continue;

        optimizations.push_back({
            freq.command,
            "alias " + suggestAliasName(freq.command) + "='" + freq.command + "'",
            "Create an alias for this frequently used command.",
            "efficiency"
        });
    }

    for (const auto& seq : sequences) {
        if (seq.count < 2 || seq.commands.size() < 2) continue;

        std::string combined = combineSequence(seq.commands);
        if (combined.empty()) continue;

        std::string original;
        for (size_t i = 0; i < seq.commands.size(); ++i) {
            if (i > 0) original += " && ";
            original += seq.commands[i];
        }

        optimizations.push_back({original, combined, "Combine these commands for efficiency.", "efficiency"});
    }

    return optimizations;
}

std::vector<Suggestion> HistoryAnalyzer::suggestionsFor(const std::string& input,
                                                        const AnalysisResult& analysis,
                                                        const std::string& last_command) const {
    std::vector<Suggestion> suggestions;
    if (input.empty()) {
        return suggestions;
    }

    auto extends = [&](const std::string& candidate) {
        return startsWith(candidate, input) && candidate != input;
    };

    for (const auto& freq : analysis.command_frequency) {
        if (!extends(freq.command)) continue;

        suggestions.push_back({freq.command,
                               "Used " + std::to_string(freq.count) + " times recently",
                               frequencyScore(FREQUENCY_SCORE, freq.count),
                               PatternDetail{PatternOrigin::FREQUENCY, freq.count, "", ""}});

        for (const auto& arg : freq.popular_args) {
            suggestions.push_back({freq.command + " " + arg.args,
                                   "Used " + std::to_string(arg.count) + " times",
                                   frequencyScore(ARGUMENT_SCORE, arg.count),
                                   PatternDetail{PatternOrigin::FREQUENCY, arg.count, "", ""}});
        }
    }

    for (const auto& pattern : analysis.recognized_patterns) {
        for (const auto& example : pattern.examples) {
            if (!extends(example)) continue;
            suggestions.push_back({example, pattern.description + " pattern", EXAMPLE_SCORE,
                                   PatternDetail{PatternOrigin::EXAMPLE, pattern.count, "", ""}});
        }
    }

    for (const auto& opt : analysis.optimizations) {
        bool applies = startsWith(opt.original, input) ||
                       (input.size() > 3 && opt.original.find(input) != std::string::npos);
        if (!applies) continue;

        suggestions.push_back({opt.optimized, "Optimization: " + opt.explanation, OPTIMIZATION_SCORE,
                               PatternDetail{PatternOrigin::OPTIMIZATION, 0, opt.original, opt.benefit_type}});
    }

    // History is newest first, so in a window [a, b] the command a followed b
    if (!last_command.empty()) {
        for (const auto& seq : analysis.command_sequences) {
            if (seq.commands.size() < 2 || seq.commands[1] != last_command) continue;

            const std::string& next = seq.commands[0];
            if (!startsWith(next, input)) continue;

            suggestions.push_back({next, "Often follows '" + last_command + "'", SEQUENCE_SCORE,
                                   PatternDetail{PatternOrigin::SEQUENCE, seq.count, "", ""}});
        }
    }

    std::stable_sort(suggestions.begin(), suggestions.end(),
                     [](const Suggestion& a, const Suggestion& b) { return a.score > b.score; });

    auto result = deduplicate(suggestions);
    if (result.size() > MAX_PATTERN_SUGGESTIONS) result.resize(MAX_PATTERN_SUGGESTIONS);
    return result;
}

std::string suggestAliasName(const std::string& command) {
    auto words = splitWhitespace(command);
    std::string alias;

    if (words.size() > 1) {
        for (const auto& word : words) {
            alias += word[0];
        }
    } else {
        alias = command.substr(0, std::min<size_t>(3, command.size()));
    }

    std::transform(alias.begin(), alias.end(), alias.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return alias;
}

std::string combineSequence(const std::vector<std::string>& commands) {
    if (commands.size() != 2) {
        return "";
    }

    const std::string& first = commands[0];
    const std::string& second = commands[1];

    if (startsWith(first, "cd ") && second == "ls") {
        return "ls " + trim(first.substr(3));
    }

    if (startsWith(first, "mkdir ") && startsWith(second, "cd ")) {
        std::string dir = trim(first.substr(6));
        if (!dir.empty() && dir == trim(second.substr(3))) {
            return "mkdir -p " + dir + " && cd $_";
        }
    }

    if (startsWith(first, "git add ") && startsWith(second, "git commit -m")) {
        std::string files = trim(first.substr(8));
        std::string message = trim(second.substr(13));
        if (files == ".") {
            return "git commit -am " + message;
        }
    }

    return "";
}

} // namespace hint
