/**
 * main.cpp - hint CLI entry point
 *
 * Usage:
 *   hint "giit sta"                             # Ranked suggestions for a partial command
 *   hint explain "find . -name '*.log'"         # Explain command
 *   hint patterns                               # Analyze ~/.bash_history
 *   hint search "git commands from today"       # Search history in plain words
 *   hint --console                              # Interactive suggestions
 *   hint --auth                                 # Store API key securely
 */

#include "hint/AnalysisScheduler.hpp"
#include "hint/CommandParser.hpp"
#include "hint/Config.hpp"
#include "hint/ContextProvider.hpp"
#include "hint/GeminiClient.hpp"
#include "hint/InferenceAdapter.hpp"
#include "hint/Log.hpp"
#include "hint/OfflineCatalog.hpp"
#include "hint/SuggestionEngine.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <termios.h>
#include <unistd.h>
#include <vector>

namespace {

const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string DIM = "\033[2m";
const std::string YELLOW = "\033[33m";
const std::string GREEN = "\033[32m";
const std::string RED = "\033[31m";
const std::string CYAN = "\033[36m";

void printUsage(const hint::EngineConfig& config) {
    std::cout << BOLD << "hint" << RESET << " - command suggestions for your shell\n\n"
              << BOLD << "Usage:" << RESET << "\n"
              << "  hint <partial command>           Suggest completions and corrections\n"
              << "  hint explain <command>           Explain the command\n"
              << "  hint patterns                    Analyze your shell history\n"
              << "  hint search <query>              Search your history in plain words\n"
              << "  hint --console                   Interactive console mode\n"
              << "  hint --auth                      Store API key securely\n"
              << "  hint --config list               Show current configuration\n"
              << "  hint --config reset              Reset to defaults\n"
              << "  hint --config model=<name>       Set Gemini model\n"
              << "  hint --config language=<lang>    Set response language\n"
              << "  hint --config offline=<on|off>   Never contact the API\n"
              << "  hint --help                      Show this help\n\n"
              << BOLD << "Options:" << RESET << "\n"
              << "  --offline                        Local heuristics only for this run\n"
              << "  --dir <path>                     Working directory for context (default: cwd)\n"
              << "  --history <file>                 History file (default: ~/.bash_history)\n\n"
              << BOLD << "Examples:" << RESET << "\n"
              << "  hint \"ls -\"                        # flag completions\n"
              << "  hint \"rm -rf /\"                    # safety warning\n"
              << "  hint --offline explain \"tar -xzf a.tgz\"\n\n"
              << BOLD << "Current Config:" << RESET << "\n"
              << "  Model: " << config.model << "\n"
              << "  Language: " << config.language << "\n"
              << "  Mode: " << (config.isOffline() ? "offline" : "online") << "\n";
}

// Search looks further back than suggestions do
const size_t SEARCH_HISTORY_LIMIT = 1000;

std::string defaultHistoryPath() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.bash_history";
}

// Newest first; bash timestamp lines ("#1700000000") and blanks are skipped
std::vector<std::string> readHistory(const std::string& path, size_t limit) {
    std::vector<std::string> lines;
    if (path.empty()) return lines;

    std::ifstream file(path);
    if (!file.good()) {
        hint::log::debug("cli", "no history at " + path);
        return lines;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::string cmd = hint::trim(line);
        if (cmd.empty()) continue;
        if (cmd[0] == '#' && cmd.size() > 1 &&
            cmd.find_first_not_of("0123456789", 1) == std::string::npos) {
            continue;
        }
        lines.push_back(cmd);
    }

    std::reverse(lines.begin(), lines.end());
    if (lines.size() > limit) lines.resize(limit);
    return lines;
}

std::string joinArgs(int argc, char* argv[], int from) {
    std::string joined;
    for (int i = from; i < argc; ++i) {
        if (i > from) joined += " ";
        joined += argv[i];
    }
    return joined;
}

void printSuggestions(const hint::AnalyzeResult& result) {
    if (result.suggestions.empty()) {
        std::cout << DIM << "No suggestions." << RESET << "\n";
        return;
    }

    for (const auto& s : result.suggestions) {
        if (s.isWarning()) {
            std::cout << "\n" << RED << BOLD << s.description << RESET << "\n"
                      << "  " << BOLD << s.command << RESET << "\n";
            continue;
        }

        std::string tag = s.type().empty() ? hint::toString(s.source()) : s.type();
        std::cout << YELLOW << "💡" << RESET << " " << BOLD << s.command << RESET
                  << "  " << s.description
                  << DIM << "  [" << tag << " " << std::fixed << std::setprecision(2) << s.score << "]"
                  << RESET << "\n";
    }
}

void printExplanation(const hint::Explanation& explanation) {
    if (auto* text = std::get_if<std::string>(&explanation)) {
        std::cout << "\n" << CYAN << "📖" << RESET << " " << *text << "\n";
        return;
    }

    const auto& structured = std::get<hint::StructuredExplanation>(explanation);
    std::cout << "\n" << CYAN << "📖 " << BOLD << structured.command << RESET << "\n"
              << structured.purpose << "\n";

    if (!structured.options.empty()) {
        std::cout << "\n" << BOLD << "Options:" << RESET << "\n";
        for (const auto& [flag, meaning] : structured.options) {
            std::cout << "  " << GREEN << flag << RESET << "  " << meaning << "\n";
        }
    }

    if (!structured.examples.empty()) {
        std::cout << "\n" << BOLD << "Examples:" << RESET << "\n";
        for (const auto& example : structured.examples) {
            std::cout << "  " << CYAN << "$ " << example.command << RESET;
            if (!example.description.empty()) {
                std::cout << "  " << DIM << example.description << RESET;
            }
            std::cout << "\n";
        }
    }
}

void printPatterns(const hint::AnalysisResult& analysis) {
    if (analysis.command_frequency.empty()) {
        std::cout << DIM << "Not enough history to analyze." << RESET << "\n";
        return;
    }

    std::cout << BOLD << "Most used commands:" << RESET << "\n";
    for (const auto& freq : analysis.command_frequency) {
        std::cout << "  " << GREEN << std::left << std::setw(12) << freq.command << RESET
                  << freq.count << "x";
        for (const auto& args : freq.popular_args) {
            std::cout << DIM << "  " << freq.command << " " << args.args << " (" << args.count << ")" << RESET;
        }
        std::cout << "\n";
    }

    if (!analysis.command_sequences.empty()) {
        std::cout << "\n" << BOLD << "Repeated sequences:" << RESET << "\n";
        for (const auto& seq : analysis.command_sequences) {
            // Stored newest first; shown in the order they were typed
            std::cout << "  ";
            for (size_t i = seq.commands.size(); i-- > 0;) {
                std::cout << seq.commands[i];
                if (i > 0) std::cout << DIM << " → " << RESET;
            }
            std::cout << DIM << "  (" << seq.count << "x)" << RESET << "\n";
        }
    }

    if (!analysis.recognized_patterns.empty()) {
        std::cout << "\n" << BOLD << "Workflows:" << RESET << "\n";
        for (const auto& pattern : analysis.recognized_patterns) {
            std::cout << "  " << CYAN << pattern.name << RESET << "  " << pattern.description
                      << DIM << "  (" << pattern.count << "x)" << RESET << "\n";
        }
    }

    if (!analysis.optimizations.empty()) {
        std::cout << "\n" << BOLD << "Optimizations:" << RESET << "\n";
        for (const auto& opt : analysis.optimizations) {
            std::cout << "  " << YELLOW << "💡" << RESET << " " << opt.original << "\n"
                      << "     " << GREEN << opt.optimized << RESET << "  " << DIM << opt.explanation
                      << " [" << opt.benefit_type << "]" << RESET << "\n";
        }
    }

    if (!analysis.ai_patterns.empty()) {
        std::cout << "\n" << BOLD << "Suggested by the model:" << RESET << "\n";
        for (const auto& ai : analysis.ai_patterns) {
            std::cout << "  " << CYAN << ai.pattern << RESET << "\n"
                      << "     " << GREEN << ai.suggestion << RESET << "  " << ai.description << "\n";
        }
    }
}

void printSearch(const hint::SearchResult& search) {
    if (search.results.empty()) {
        std::cout << DIM << "No matching commands." << RESET << "\n";
        return;
    }

    std::cout << BOLD << "Matches for \"" << search.query << "\"" << RESET;
    if (search.timeframe) {
        std::cout << DIM << " (" << search.timeframe->label << ")" << RESET;
    }
    if (search.offline) std::cout << DIM << " [local]" << RESET;
    std::cout << "\n";

    for (const auto& match : search.results) {
        std::cout << "  " << GREEN << match.command << RESET << "  " << match.reason
                  << DIM << "  [" << match.match_type << " " << std::fixed << std::setprecision(2)
                  << match.score << "]" << RESET << "\n";
    }
}

void printStats(const hint::CacheStats& stats) {
    std::cout << BOLD << "Cache:" << RESET << " " << stats.size << "/" << stats.max_size << " entries\n"
              << "  suggestions:  " << stats.categories.suggestions << "\n"
              << "  explanations: " << stats.categories.explanations << "\n"
              << "  structured:   " << stats.categories.structured << "\n"
              << "  patterns:     " << stats.categories.patterns << "\n"
              << "  other:        " << stats.categories.other << "\n";
    if (stats.pattern_analysis_age_seconds >= 0) {
        std::cout << "  last history analysis " << stats.pattern_analysis_age_seconds << "s ago\n";
    }
}

std::string readHiddenLine() {
    struct termios old_term, new_term;
    bool is_tty = tcgetattr(STDIN_FILENO, &old_term) == 0;
    if (is_tty) {
        new_term = old_term;
        new_term.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &new_term);
    }

    std::string line;
    std::getline(std::cin, line);

    if (is_tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &old_term);
    }
    std::cout << "\n";
    return line;
}

int runAuth(const hint::EngineConfig& config) {
    // Prompt for API key without echoing (like password input)
    std::cout << "Paste your API key (hidden input): ";
    std::cout.flush();

    std::string new_key = hint::trim(readHiddenLine());
    if (new_key.empty()) {
        std::cerr << RED << "Error: Empty API key." << RESET << "\n";
        return 1;
    }

    std::cout << "Validating API key...\n";
    hint::GeminiClient test_client(new_key, config.model, config.language, config.timeout_seconds);
    std::string error_msg;
    if (!test_client.validate(error_msg)) {
        std::cerr << RED << "Error: Invalid API key - " << error_msg << RESET << "\n";
        return 1;
    }

    if (!hint::storeInKeyring("api_key", new_key, "hint API Key")) {
        std::cerr << RED << "Error: Could not save the API key to the keyring." << RESET << "\n";
        return 1;
    }

    std::cout << GREEN << "API key validated and saved!" << RESET << "\n";
    return 0;
}

int runConfig(const std::string& config_arg, const hint::EngineConfig& config) {
    if (config_arg == "list") {
        std::cout << BOLD << "Current Configuration:" << RESET << "\n"
                  << "  Model:            " << config.model << "\n"
                  << "  Language:         " << config.language << "\n"
                  << "  API key:          " << (config.api_key.empty() ? "not set" : "set") << "\n"
                  << "  Offline:          " << (config.offline ? "on" : "off") << "\n"
                  << "  Min input length: " << config.min_input_length << "\n"
                  << "  Debounce:         " << config.debounce_ms << "ms\n"
                  << "  Cache size:       " << config.cache_size << "\n"
                  << "  Max suggestions:  " << config.max_suggestions << "\n"
                  << "  History depth:    " << config.history_depth << "\n"
                  << "  Config file:      " << hint::configDir() << "/config.json\n";
        return 0;
    }

    if (config_arg == "reset") {
        // libsecret has no simple delete, so the defaults are stored instead
        bool ok = hint::storeInKeyring("model", hint::GeminiClient::getDefaultModel(), "hint Model") &&
                  hint::storeInKeyring("language", hint::GeminiClient::getDefaultLanguage(), "hint Language");

        std::error_code ec;
        std::filesystem::remove(hint::configDir() + "/config.json", ec);
        if (ec) {
            std::cerr << RED << "Error: " << ec.message() << RESET << "\n";
            return 1;
        }

        if (!ok) return 1;
        std::cout << GREEN << "Configuration reset to defaults." << RESET << "\n";
        return 0;
    }

    if (hint::startsWith(config_arg, "model=")) {
        std::string new_model = config_arg.substr(6);
        if (new_model.empty()) {
            std::cerr << RED << "Error: Empty model name." << RESET << "\n";
            return 1;
        }

        if (config.api_key.empty()) {
            std::cerr << RED << "Error: Configure API key first with 'hint --auth'" << RESET << "\n";
            return 1;
        }

        std::cout << "Validating model " << new_model << "...\n";
        hint::GeminiClient test_client(config.api_key, new_model, config.language, config.timeout_seconds);
        std::string error_msg;
        if (!test_client.validate(error_msg)) {
            std::cerr << RED << "Error: Invalid model - " << error_msg << RESET << "\n";
            return 1;
        }

        if (!hint::storeInKeyring("model", new_model, "hint Model")) return 1;
        std::cout << GREEN << "Model validated and set: " << new_model << RESET << "\n";
        return 0;
    }

    if (hint::startsWith(config_arg, "language=")) {
        std::string new_lang = config_arg.substr(9);
        if (new_lang.empty()) {
            std::cerr << RED << "Error: Empty language code." << RESET << "\n";
            return 1;
        }

        if (!hint::storeInKeyring("language", new_lang, "hint Language")) return 1;
        std::cout << GREEN << "Language set: " << new_lang << RESET << "\n";
        return 0;
    }

    if (hint::startsWith(config_arg, "offline=")) {
        std::string value = config_arg.substr(8);
        if (value != "on" && value != "off") {
            std::cerr << RED << "Error: Use offline=on or offline=off." << RESET << "\n";
            return 1;
        }

        if (!hint::storeConfigValue("offline", value == "on" ? "true" : "false")) return 1;
        std::cout << GREEN << "Offline mode " << value << RESET << "\n";
        return 0;
    }

    std::cerr << RED << "Unknown config. Use: hint --config list|reset|model=<name>|language=<lang>|offline=<on|off>"
              << RESET << "\n";
    return 1;
}

int runExplain(hint::SuggestionEngine& engine, hint::GeminiClient* gemini, const std::string& command) {
    std::string base = hint::baseCommand(command);

    // Free-text explanations stream when online; structured ones come back whole
    if (gemini && !engine.isOffline() && !hint::prefersStructuredExplanation(base)) {
        std::cout << "\n" << CYAN << "📖" << RESET << " ";
        auto response = gemini->completeStreaming(hint::InferenceAdapter::explainRequest(command),
                                                  [](const std::string& chunk) {
                                                      std::cout << chunk;
                                                      std::cout.flush();
                                                  });
        std::cout << "\n";
        if (response.success) {
            return 0;
        }
        hint::log::warn("cli", "streaming failed, falling back: " + response.error);
    }

    printExplanation(engine.explain(command));
    return 0;
}

int runConsole(hint::SuggestionEngine& engine, hint::TerminalContext context, const hint::EngineConfig& config) {
    std::mutex console_mutex;
    std::condition_variable console_cv;
    size_t shown = 0;

    hint::AnalysisScheduler scheduler(
        engine, std::chrono::milliseconds(config.debounce_ms), config.min_input_length,
        [&](const std::string& input, const hint::AnalyzeResult& result) {
            std::lock_guard<std::mutex> lock(console_mutex);
            if (!result.suggestions.empty() || hint::trim(input).size() >= config.min_input_length) {
                printSuggestions(result);
            }
            shown++;
            console_cv.notify_all();
        });

    std::cout << BOLD << "hint interactive console" << RESET
              << (engine.isOffline() ? " (offline)" : "") << "\n";
    std::cout << "Type a partial command for suggestions. Commands: :explain <cmd>, :run <cmd>,\n"
              << ":patterns, :search <query>, :stats, :clear [prefix], exit\n\n";

    std::string line;
    while (true) {
        std::cout << CYAN << "hint > " << RESET;
        std::cout.flush();

        if (!std::getline(std::cin, line)) {
            break;  // EOF
        }

        std::string trimmed = hint::trim(line);
        if (trimmed.empty()) {
            scheduler.cancel();
            continue;
        }

        if (trimmed == "exit" || trimmed == "quit") {
            std::cout << "Goodbye!\n";
            break;
        }

        if (hint::startsWith(trimmed, ":explain ")) {
            printExplanation(engine.explain(trimmed.substr(9)));
            continue;
        }

        if (hint::startsWith(trimmed, ":run ")) {
            // Records the command as executed so later suggestions see it
            context.recent_commands.insert(context.recent_commands.begin(), hint::trim(trimmed.substr(5)));
            if (context.recent_commands.size() > config.history_depth) {
                context.recent_commands.resize(config.history_depth);
            }
            std::cout << DIM << "recorded" << RESET << "\n";
            continue;
        }

        if (trimmed == ":patterns") {
            printPatterns(engine.analyzePatterns(context.recent_commands, context));
            continue;
        }

        if (hint::startsWith(trimmed, ":search ")) {
            printSearch(engine.searchHistory(hint::trim(trimmed.substr(8)), context.recent_commands, context));
            continue;
        }

        if (trimmed == ":stats") {
            printStats(engine.getCacheStats());
            continue;
        }

        if (trimmed == ":clear") {
            engine.clearCache();
            std::cout << GREEN << "Cache cleared." << RESET << "\n";
            continue;
        }

        if (hint::startsWith(trimmed, ":clear ")) {
            size_t removed = engine.clearCacheByPrefix(hint::trim(trimmed.substr(7)));
            std::cout << GREEN << "Removed " << removed << " entries." << RESET << "\n";
            continue;
        }

        std::unique_lock<std::mutex> lock(console_mutex);
        size_t before = shown;
        lock.unlock();

        scheduler.submit(line, context);

        lock.lock();
        auto limit = std::chrono::milliseconds(config.debounce_ms) + std::chrono::seconds(config.timeout_seconds + 1);
        if (!console_cv.wait_for(lock, limit, [&]() { return shown != before; })) {
            lock.unlock();
            scheduler.cancel();
            std::cerr << YELLOW << "No answer in time." << RESET << "\n";
        }
    }

    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    hint::EngineConfig config = hint::loadConfig();

    if (argc < 2) {
        printUsage(config);
        return 0;
    }

    std::string first_arg = argv[1];

    if (first_arg == "--help" || first_arg == "-h") {
        printUsage(config);
        return 0;
    }

    // Parse all flags first (in any order)
    std::string directory;
    std::string history_path = defaultHistoryPath();
    bool console_mode = false;
    int arg_idx = 1;

    while (arg_idx < argc) {
        std::string arg = argv[arg_idx];

        if (arg == "--auth") {
            // --auth must be standalone with no other arguments
            if (argc != 2) {
                std::cerr << RED << "Error: --auth must be used alone." << RESET << "\n";
                std::cerr << "Usage: hint --auth\n";
                return 1;
            }
            return runAuth(config);
        }
        else if (arg == "--config") {
            // --config must be standalone (only with its own argument)
            if (argc != 3) {
                std::cerr << RED << "Error: --config must be used alone with its argument." << RESET << "\n";
                std::cerr << "Usage: hint --config list|reset|model=<name>|language=<lang>|offline=<on|off>\n";
                return 1;
            }
            return runConfig(argv[2], config);
        }
        else if (arg == "--offline") {
            config.offline = true;
            arg_idx++;
        }
        else if (arg == "--dir" || arg == "--history") {
            if (arg_idx + 1 >= argc) {
                std::cerr << RED << "Error: " << arg << " needs a value." << RESET << "\n";
                return 1;
            }
            (arg == "--dir" ? directory : history_path) = argv[arg_idx + 1];
            arg_idx += 2;
        }
        else if (arg == "--console") {
            console_mode = true;
            arg_idx++;
        }
        else if (hint::startsWith(arg, "--")) {
            // Unknown flag starting with --
            std::cerr << RED << "Error: Unknown flag '" << arg << "'" << RESET << "\n";
            std::cerr << "Valid flags: --offline, --dir, --history, --console, --config, --auth, --help\n";
            return 1;
        }
        else {
            // Not a flag, stop parsing flags
            break;
        }
    }

    if (directory.empty()) {
        std::error_code ec;
        directory = std::filesystem::current_path(ec).string();
        if (ec) directory = "~";
    }

    hint::TerminalContext context;
    context.current_directory = directory;
    context.recent_commands = readHistory(history_path, config.history_depth);

    std::unique_ptr<hint::GeminiClient> gemini;
    if (!config.isOffline()) {
        gemini = std::make_unique<hint::GeminiClient>(config.api_key, config.model, config.language,
                                                      config.timeout_seconds);
    }
    hint::FilesystemContextProvider files;
    hint::SuggestionEngine engine(config, gemini.get(), &files);

    if (console_mode) {
        return runConsole(engine, context, config);
    }

    // Remaining args are the command
    if (arg_idx >= argc) {
        std::cerr << RED << "Error: No command provided." << RESET << "\n";
        printUsage(config);
        return 1;
    }

    first_arg = argv[arg_idx];

    if (first_arg == "explain" && argc > arg_idx + 1) {
        return runExplain(engine, gemini.get(), joinArgs(argc, argv, arg_idx + 1));
    }

    if (first_arg == "patterns") {
        printPatterns(engine.analyzePatterns(context.recent_commands, context));
        return 0;
    }

    if (first_arg == "search" && argc > arg_idx + 1) {
        std::vector<std::string> history = readHistory(history_path, SEARCH_HISTORY_LIMIT);
        printSearch(engine.searchHistory(joinArgs(argc, argv, arg_idx + 1), history, context));
        return 0;
    }

    std::string input = joinArgs(argc, argv, arg_idx);
    if (hint::trim(input).size() < config.min_input_length) {
        std::cerr << YELLOW << "Type at least " << config.min_input_length << " characters." << RESET << "\n";
        return 1;
    }

    auto result = engine.analyze(input, context);
    printSuggestions(result);
    return result.has_warning ? 2 : 0;
}
