/**
 * test_inference_adapter.cpp - Unit tests for InferenceAdapter and reply parsing
 */

#include "hint/InferenceAdapter.hpp"
#include "hint/Log.hpp"

#include "FakeClient.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using hint_test::FakeClient;

void test_parse_suggestion_lines() {
    auto suggestions = hint::parseSuggestionLines(
        "1. git status: Show the working tree status\n"
        "2. `git stash`: Stash local changes\r\n"
        "Here are some ideas\n"
        "\n"
        "- **git log**: Show history\n");

    assert(suggestions.size() == 3);
    assert(suggestions[0].command == "git status");
    assert(suggestions[0].description == "Show the working tree status");
    assert(suggestions[1].command == "git stash");
    assert(suggestions[2].command == "git log");
    assert(suggestions[2].description == "Show history");
    for (const auto& s : suggestions) {
        assert(s.source() == hint::SuggestionSource::AI);
        assert(s.score == 0.7);
    }

    std::cout << "[PASS] test_parse_suggestion_lines\n";
}

void test_parse_fenced_structured_explanation() {
    auto parsed = hint::parseStructuredExplanation(
        "Here you go:\n"
        "```json\n"
        "{\"command\": \"ls -la\", \"purpose\": \"List all files in long format\",\n"
        " \"options\": {\"-l\": \"long format\", \"-a\": \"include hidden\"},\n"
        " \"examples\": [{\"command\": \"ls -la /tmp\", \"description\": \"List /tmp\"}, \"ls -lah\"]}\n"
        "```\n");

    assert(parsed.has_value());
    assert(parsed->command == "ls -la");
    assert(parsed->purpose == "List all files in long format");
    assert(parsed->options.size() == 2);
    assert(parsed->options.at("-a") == "include hidden");
    assert(parsed->examples.size() == 2);
    assert(parsed->examples[0].description == "List /tmp");
    assert(parsed->examples[1].command == "ls -lah");
    assert(parsed->examples[1].description.empty());

    std::cout << "[PASS] test_parse_fenced_structured_explanation\n";
}

void test_parse_bare_structured_explanation() {
    auto parsed = hint::parseStructuredExplanation(
        "Sure! {\"command\": \"cd ..\", \"purpose\": \"Go up one directory\"} Hope this helps.");

    assert(parsed.has_value());
    assert(parsed->command == "cd ..");
    assert(parsed->options.empty());
    assert(parsed->examples.empty());

    std::cout << "[PASS] test_parse_bare_structured_explanation\n";
}

void test_malformed_structured_explanation() {
    assert(!hint::parseStructuredExplanation("not json at all").has_value());
    assert(!hint::parseStructuredExplanation("{\"command\": \"ls\"}").has_value());
    assert(!hint::parseStructuredExplanation("{\"command\": \"ls\", \"purpose\": \"\"}").has_value());
    assert(!hint::parseStructuredExplanation("{\"command\": 3, \"purpose\": \"x\"}").has_value());
    assert(!hint::parseStructuredExplanation("```json\n{\"command\": \"ls\",\n```").has_value());

    std::cout << "[PASS] test_malformed_structured_explanation\n";
}

void test_parse_pattern_lines() {
    auto patterns = hint::parsePatternLines(
        "Pattern: Git workflow\n"
        "Suggestion: git push: Push after committing\n"
        "Suggestion: git status: Check the state first\n"
        "Pattern: Navigation\n"
        "- Suggestion: ls -la: List what is here\n"
        "Some closing remark\n");

    assert(patterns.size() == 3);
    assert(patterns[0].pattern == "Git workflow");
    assert(patterns[0].suggestion == "git push");
    assert(patterns[0].description == "Push after committing");
    assert(patterns[2].pattern == "Navigation");
    assert(patterns[2].suggestion == "ls -la");

    std::cout << "[PASS] test_parse_pattern_lines\n";
}

void test_pattern_lines_capped() {
    std::string content;
    for (int i = 0; i < 8; ++i) {
        content += "Suggestion: cmd" + std::to_string(i) + ": description\n";
    }

    auto patterns = hint::parsePatternLines(content);

    assert(patterns.size() == 5);
    assert(patterns[0].pattern == "Suggestion");

    std::cout << "[PASS] test_pattern_lines_capped\n";
}

void test_suggestion_prompt() {
    hint::TerminalContext context;
    context.current_directory = "/repo";
    context.recent_commands = {"cmd1", "cmd2", "cmd3", "cmd4", "cmd5", "cmd6", "cmd7"};
    context.last_error = std::string(400, 'e');

    std::string prompt = hint::InferenceAdapter::buildSuggestionPrompt("git st", context);

    assert(prompt.find("Current command: git st") != std::string::npos);
    assert(prompt.find("Current directory: /repo") != std::string::npos);
    assert(prompt.find("cmd1, cmd2, cmd3, cmd4, cmd5") != std::string::npos);
    assert(prompt.find("cmd6") == std::string::npos);
    assert(prompt.find(std::string(300, 'e')) != std::string::npos);
    assert(prompt.find(std::string(301, 'e')) == std::string::npos);

    std::cout << "[PASS] test_suggestion_prompt\n";
}

void test_suggest_through_client() {
    FakeClient fake = FakeClient::replying("git status: Show status\ngit stash: Stash changes");
    hint::InferenceAdapter adapter(fake);

    hint::TerminalContext context;
    auto result = adapter.suggest("git st", context);

    assert(result.success);
    assert(result.suggestions.size() == 2);
    assert(fake.calls() == 1);

    auto requests = fake.requests();
    assert(!requests[0].system_instruction.empty());
    assert(requests[0].prompt.find("git st") != std::string::npos);

    std::cout << "[PASS] test_suggest_through_client\n";
}

void test_transport_failure_reported() {
    FakeClient fake = FakeClient::failing("Network error: connection refused");
    hint::InferenceAdapter adapter(fake);

    auto suggestions = adapter.suggest("git st", hint::TerminalContext{});
    assert(!suggestions.success);
    assert(suggestions.suggestions.empty());
    assert(suggestions.error == "Network error: connection refused");

    auto text = adapter.explain("ls");
    assert(!text.success);

    auto patterns = adapter.analyzePatterns({"ls", "pwd"}, {});
    assert(!patterns.success);
    assert(patterns.patterns.empty());

    std::cout << "[PASS] test_transport_failure_reported\n";
}

void test_explain_and_patterns_requests() {
    FakeClient fake = FakeClient::replying("  Lists directory contents.  ");
    hint::InferenceAdapter adapter(fake);

    auto text = adapter.explain("ls -la");
    assert(text.success);
    assert(text.content == "Lists directory contents.");

    std::vector<hint::Optimization> local = {
        {"mkdir a && cd a", "mkdir -p a && cd $_", "Combine these commands for efficiency.", "efficiency"}
    };
    fake.setHandler([](const hint::InferenceRequest&) {
        return hint::InferenceResponse{"Pattern: Setup\nSuggestion: make: Build next", true, ""};
    });
    auto patterns = adapter.analyzePatterns({"mkdir a", "cd a"}, local);

    assert(patterns.success);
    assert(patterns.patterns.size() == 1);
    assert(patterns.patterns[0].suggestion == "make");

    auto requests = fake.requests();
    assert(requests.size() == 2);
    assert(requests[0].prompt.find("ls -la") != std::string::npos);
    assert(requests[1].prompt.find("mkdir a && cd a -> mkdir -p a && cd $_") != std::string::npos);

    std::cout << "[PASS] test_explain_and_patterns_requests\n";
}

void test_parse_search_matches() {
    auto fenced = hint::parseSearchMatches(
        "Found these:\n"
        "```json\n"
        "{\"results\": [\n"
        "  {\"command\": \"git push origin main\", \"score\": 0.9, \"matchType\": \"semantic\",\n"
        "   \"reason\": \"Pushes your work\"},\n"
        "  {\"score\": 0.8},\n"
        "  {\"command\": \"  \", \"score\": 0.8},\n"
        "  {\"command\": \"git pull\", \"score\": 3.5}\n"
        "]}\n"
        "```\n");

    assert(fenced.has_value());
    assert(fenced->size() == 2);
    assert((*fenced)[0].command == "git push origin main");
    assert((*fenced)[0].match_type == "semantic");
    assert((*fenced)[0].reason == "Pushes your work");
    assert((*fenced)[1].command == "git pull");
    assert((*fenced)[1].score == 1.0);
    assert((*fenced)[1].match_type == "unknown");
    assert((*fenced)[1].reason == "Matches search criteria");

    auto bare = hint::parseSearchMatches("[{\"command\": \"ls -la\"}]");
    assert(bare.has_value());
    assert(bare->size() == 1);
    assert((*bare)[0].score == 0.5);

    std::vector<std::string> lines;
    hint::log::setSink([&](hint::log::Level, const std::string& line) { lines.push_back(line); });
    assert(!hint::parseSearchMatches("no json here").has_value());
    assert(!hint::parseSearchMatches("{\"matches\": []}").has_value());
    hint::log::setSink(nullptr);
    assert(lines.size() == 2);

    std::cout << "[PASS] test_parse_search_matches\n";
}

void test_search_request() {
    FakeClient fake = FakeClient::replying("{\"results\": [{\"command\": \"docker ps\", \"score\": 0.7}]}");
    hint::InferenceAdapter adapter(fake);

    std::vector<std::string> history;
    for (int i = 0; i < 60; ++i) {
        history.push_back("cmd" + std::to_string(i));
    }

    auto result = adapter.searchHistory("running containers", history, "");
    assert(result.success);
    assert(result.matches.size() == 1);
    assert(result.matches[0].command == "docker ps");

    auto requests = fake.requests();
    assert(requests[0].prompt.find("\"running containers\"") != std::string::npos);
    assert(requests[0].prompt.find("cmd49\n") != std::string::npos);
    assert(requests[0].prompt.find("cmd50\n") == std::string::npos);
    assert(requests[0].prompt.find("Current directory: ~") != std::string::npos);
    assert(requests[0].max_tokens == 500);

    fake.setHandler([](const hint::InferenceRequest&) {
        return hint::InferenceResponse{"I could not find anything", true, ""};
    });
    hint::log::setSink([](hint::log::Level, const std::string&) {});
    auto malformed = adapter.searchHistory("running containers", history, "/srv");
    hint::log::setSink(nullptr);
    assert(!malformed.success);
    assert(malformed.error == "malformed search results");

    std::cout << "[PASS] test_search_request\n";
}

int main() {
    std::cout << "Running InferenceAdapter tests...\n\n";

    test_parse_suggestion_lines();
    test_parse_fenced_structured_explanation();
    test_parse_bare_structured_explanation();
    test_malformed_structured_explanation();
    test_parse_pattern_lines();
    test_pattern_lines_capped();
    test_suggestion_prompt();
    test_suggest_through_client();
    test_transport_failure_reported();
    test_explain_and_patterns_requests();
    test_parse_search_matches();
    test_search_request();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
