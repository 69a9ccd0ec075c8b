/**
 * InferenceAdapter.cpp - Prompts for the remote endpoint and parsing of its replies
 */

#include "hint/InferenceAdapter.hpp"
#include "hint/CommandParser.hpp"
#include "hint/Log.hpp"

#include <algorithm>
#include <regex>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace hint {

namespace {

const size_t PROMPT_RECENT_COMMANDS = 5;
const size_t PROMPT_HISTORY_COMMANDS = 10;
const size_t PROMPT_ERROR_CHARS = 300;
const size_t MAX_AI_PATTERNS = 5;
const size_t PROMPT_SEARCH_COMMANDS = 50;
const double AI_SCORE = 0.7;

const std::string SUGGEST_SYSTEM =
    "You are a terminal assistant. Provide command completions and suggestions based on user input and context.";
const std::string EXPLAIN_SYSTEM =
    "You are a terminal assistant providing clear, accurate, and concise explanations of command line commands.";
const std::string STRUCTURED_SYSTEM =
    "You provide structured explanations of command line commands in valid JSON format.";
const std::string PATTERN_SYSTEM =
    "You analyze command history patterns to provide intelligent suggestions.";
const std::string SEARCH_SYSTEM =
    "You are a specialized search assistant that finds relevant commands in command history "
    "based on natural language queries.";

std::string stripDecoration(std::string text) {
    text = trim(text);
    while (!text.empty() && (text.front() == '`' || text.front() == '"' || text.front() == '*')) {
        text.erase(0, 1);
    }
    while (!text.empty() && (text.back() == '`' || text.back() == '"' || text.back() == '*')) {
        text.pop_back();
    }
    return trim(text);
}

std::string jsonString(const json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

// The JSON part of a reply: a ``` fence if there is one, else the outermost open/close pair
std::string jsonPayload(const std::string& content, char open, char close) {
    static const std::regex fence(R"(```(?:json)?\s*([\s\S]*?)\s*```)");

    std::smatch match;
    if (std::regex_search(content, match, fence)) {
        return match[1].str();
    }

    size_t start = content.find(open);
    size_t end = content.rfind(close);
    if (start != std::string::npos && end != std::string::npos && end > start) {
        return content.substr(start, end - start + 1);
    }
    return content;
}

} // anonymous namespace

InferenceAdapter::InferenceAdapter(InferenceClient& client) : client_(client) {}

InferenceAdapter::~InferenceAdapter() = default;

std::string InferenceAdapter::buildSuggestionPrompt(const std::string& input, const TerminalContext& context) {
    std::ostringstream recent;
    size_t count = std::min(PROMPT_RECENT_COMMANDS, context.recent_commands.size());
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) recent << ", ";
        recent << context.recent_commands[i];
    }

    std::ostringstream prompt;
    prompt << "Current command: " << input << "\n"
           << "Current directory: " << context.current_directory << "\n"
           << "Recent commands: " << recent.str() << "\n";

    if (!context.last_error.empty()) {
        prompt << "Last error: " << context.last_error.substr(0, PROMPT_ERROR_CHARS) << "\n";
    }

    prompt << "\nBased on this context, suggest 5 likely command completions or next actions.\n"
           << "Format each suggestion as \"command: brief explanation\"\n"
           << "Keep suggestions relevant and focused on the current command.";

    return prompt.str();
}

RemoteSuggestions InferenceAdapter::suggest(const std::string& input, const TerminalContext& context) {
    RemoteSuggestions result;

    InferenceRequest request;
    request.system_instruction = SUGGEST_SYSTEM;
    request.prompt = buildSuggestionPrompt(input, context);
    request.temperature = 0.3;
    request.max_tokens = 150;

    auto response = client_.complete(request);
    if (!response.success) {
        result.error = response.error;
        return result;
    }

    result.suggestions = parseSuggestionLines(response.content);
    result.success = true;
    return result;
}

InferenceRequest InferenceAdapter::explainRequest(const std::string& command) {
    std::ostringstream prompt;
    prompt << "Explain this terminal command in a clear and concise way:\n"
           << command << "\n\n"
           << "Include:\n"
           << "1. What the command does\n"
           << "2. Key arguments and flags used\n"
           << "3. Potential risks or side effects, if any\n"
           << "4. Common use cases\n\n"
           << "Format your response as a single concise paragraph.";

    InferenceRequest request;
    request.system_instruction = EXPLAIN_SYSTEM;
    request.prompt = prompt.str();
    request.temperature = 0.3;
    request.max_tokens = 200;
    return request;
}

RemoteText InferenceAdapter::explain(const std::string& command) {
    auto response = client_.complete(explainRequest(command));
    return {trim(response.content), response.success, response.error};
}

RemoteText InferenceAdapter::explainStructured(const std::string& command) {
    std::ostringstream prompt;
    prompt << "Explain this terminal command in detail:\n"
           << command << "\n\n"
           << "Provide a structured response with:\n"
           << "- command: The exact command being explained\n"
           << "- purpose: A short description of what this command does\n"
           << "- options: A dictionary of key flags/options used with brief explanations\n"
           << "- examples: A couple of related example commands with brief descriptions\n\n"
           << "IMPORTANT: Format your response as a valid JSON object with those exact fields.";

    InferenceRequest request;
    request.system_instruction = STRUCTURED_SYSTEM;
    request.prompt = prompt.str();
    request.temperature = 0.2;
    request.max_tokens = 500;

    auto response = client_.complete(request);
    return {response.content, response.success, response.error};
}

RemotePatterns InferenceAdapter::analyzePatterns(const std::vector<std::string>& history,
                                                 const std::vector<Optimization>& local_optimizations) {
    RemotePatterns result;

    std::ostringstream prompt;
    prompt << "Analyze these recent terminal commands and identify patterns or suggest follow-up commands:\n";
    size_t count = std::min(PROMPT_HISTORY_COMMANDS, history.size());
    for (size_t i = 0; i < count; ++i) {
        prompt << history[i] << "\n";
    }

    if (!local_optimizations.empty()) {
        prompt << "\nI've identified these potential optimizations:\n";
        for (const auto& opt : local_optimizations) {
            prompt << "- " << opt.original << " -> " << opt.optimized << " (" << opt.explanation << ")\n";
        }
    }

    prompt << "\nBased on this command history:\n"
           << "1. What patterns do you see?\n"
           << "2. What might be the user's next likely command?\n"
           << "3. Are there command optimizations or shortcuts you would suggest?\n\n"
           << "Format each pattern as a line \"Pattern: <name>\" followed by lines "
           << "\"Suggestion: <command>: <explanation>\".";

    InferenceRequest request;
    request.system_instruction = PATTERN_SYSTEM;
    request.prompt = prompt.str();
    request.temperature = 0.3;
    request.max_tokens = 200;

    auto response = client_.complete(request);
    if (!response.success) {
        result.error = response.error;
        return result;
    }

    result.patterns = parsePatternLines(response.content);
    result.success = true;
    return result;
}

RemoteMatches InferenceAdapter::searchHistory(const std::string& query,
                                             const std::vector<std::string>& history,
                                             const std::string& directory) {
    RemoteMatches result;

    std::ostringstream prompt;
    prompt << "Search through this command history for: \"" << query << "\"\n\n"
           << "Commands:\n";
    size_t count = std::min(PROMPT_SEARCH_COMMANDS, history.size());
    for (size_t i = 0; i < count; ++i) {
        prompt << history[i] << "\n";
    }
    prompt << "\nCurrent directory: " << (directory.empty() ? "~" : directory) << "\n\n"
           << "Return matches as a JSON array of objects with:\n"
           << "- command: the matching command\n"
           << "- score: relevance score between 0.0-1.0\n"
           << "- matchType: why this matched (e.g. \"exact\", \"semantic\", \"pattern\")\n"
           << "- reason: brief explanation of why this matches the query\n\n"
           << "Return ONLY valid JSON in the following format:\n"
           << "{\"results\": [{command, score, matchType, reason}, ...]}";

    InferenceRequest request;
    request.system_instruction = SEARCH_SYSTEM;
    request.prompt = prompt.str();
    request.temperature = 0.3;
    request.max_tokens = 500;

    auto response = client_.complete(request);
    if (!response.success) {
        result.error = response.error;
        return result;
    }

    auto matches = parseSearchMatches(response.content);
    if (!matches) {
        result.error = "malformed search results";
        return result;
    }

    result.matches = std::move(*matches);
    result.success = true;
    return result;
}

std::vector<Suggestion> parseSuggestionLines(const std::string& content) {
    static const std::regex line_pattern(R"(^\s*(?:\d+[.)]\s*|[-*]\s+)?([^:]+):(.+)$)");

    std::vector<Suggestion> suggestions;
    std::istringstream iss(content);
    std::string line;

    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) continue;

        std::smatch match;
        if (!std::regex_match(line, match, line_pattern)) continue;

        std::string command = stripDecoration(match[1].str());
        std::string description = stripDecoration(match[2].str());
        if (command.empty()) continue;

        suggestions.push_back({command, description, AI_SCORE, AiDetail{}});
    }

    return suggestions;
}

std::optional<StructuredExplanation> parseStructuredExplanation(const std::string& content) {
    try {
        json body = json::parse(jsonPayload(content, '{', '}'));
        if (!body.is_object()) {
            log::warn("inference", "structured explanation is not a JSON object");
            return std::nullopt;
        }

        if (!body.contains("command") || !body["command"].is_string() ||
            !body.contains("purpose") || !body["purpose"].is_string() ||
            body["command"].get<std::string>().empty() || body["purpose"].get<std::string>().empty()) {
            log::warn("inference", "structured explanation is missing command or purpose");
            return std::nullopt;
        }

        StructuredExplanation explanation;
        explanation.command = body["command"].get<std::string>();
        explanation.purpose = body["purpose"].get<std::string>();

        if (body.contains("options") && body["options"].is_object()) {
            for (auto it = body["options"].begin(); it != body["options"].end(); ++it) {
                explanation.options[it.key()] = jsonString(it.value());
            }
        }

        if (body.contains("examples") && body["examples"].is_array()) {
            for (const auto& example : body["examples"]) {
                if (example.is_string()) {
                    explanation.examples.push_back({example.get<std::string>(), ""});
                } else if (example.is_object() && example.contains("command")) {
                    std::string description = example.contains("description")
                                                  ? jsonString(example["description"]) : "";
                    explanation.examples.push_back({jsonString(example["command"]), description});
                }
            }
        }

        return explanation;
    } catch (const json::exception& e) {
        log::warn("inference", std::string("malformed structured explanation: ") + e.what());
        return std::nullopt;
    }
}

std::optional<std::vector<RemoteMatch>> parseSearchMatches(const std::string& content) {
    try {
        size_t brace = content.find('{');
        size_t bracket = content.find('[');
        bool array_first = bracket != std::string::npos && (brace == std::string::npos || bracket < brace);

        json body = json::parse(array_first ? jsonPayload(content, '[', ']') : jsonPayload(content, '{', '}'));
        const json* items = nullptr;
        if (body.is_array()) {
            items = &body;
        } else if (body.is_object() && body.contains("results") && body["results"].is_array()) {
            items = &body["results"];
        } else {
            log::warn("inference", "search reply has no results array");
            return std::nullopt;
        }

        std::vector<RemoteMatch> matches;
        for (const auto& item : *items) {
            if (!item.is_object() || !item.contains("command") || !item["command"].is_string()) continue;

            RemoteMatch match;
            match.command = trim(item["command"].get<std::string>());
            if (match.command.empty()) continue;

            if (item.contains("score") && item["score"].is_number()) {
                match.score = std::clamp(item["score"].get<double>(), 0.0, 1.0);
            }
            if (item.contains("matchType") && item["matchType"].is_string() &&
                !item["matchType"].get<std::string>().empty()) {
                match.match_type = item["matchType"].get<std::string>();
            }
            if (item.contains("reason") && item["reason"].is_string() &&
                !item["reason"].get<std::string>().empty()) {
                match.reason = item["reason"].get<std::string>();
            }
            matches.push_back(match);
        }

        return matches;
    } catch (const json::exception& e) {
        log::warn("inference", std::string("malformed search results: ") + e.what());
        return std::nullopt;
    }
}

std::vector<AiPattern> parsePatternLines(const std::string& content) {
    static const std::regex suggestion_line(
        R"(^\s*(?:\d+\.\s*)?[-*]?\s*[Ss]uggest(?:ion)?:?\s*`?([^`:]+)`?:\s*(.+)$)");
    static const std::regex pattern_line(R"(^\s*(?:\d+\.\s*)?[-*]?\s*[Pp]attern:?\s*(.+)$)");

    std::vector<AiPattern> patterns;
    std::string current_pattern;
    std::istringstream iss(content);
    std::string line;

    while (std::getline(iss, line) && patterns.size() < MAX_AI_PATTERNS) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        std::smatch match;
        if (std::regex_match(line, match, suggestion_line)) {
            patterns.push_back({current_pattern.empty() ? "Suggestion" : current_pattern,
                                trim(match[1].str()), trim(match[2].str())});
        } else if (std::regex_match(line, match, pattern_line)) {
            current_pattern = stripDecoration(match[1].str());
        }
    }

    return patterns;
}

} // namespace hint
