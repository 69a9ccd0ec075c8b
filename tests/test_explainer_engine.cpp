/**
 * test_explainer_engine.cpp - Unit tests for ExplainerEngine
 */

#include "hint/ExplainerEngine.hpp"
#include "hint/InferenceAdapter.hpp"
#include "hint/OfflineCatalog.hpp"
#include "hint/SuggestionCache.hpp"

#include "FakeClient.hpp"

#include <cassert>
#include <iostream>
#include <string>

using hint_test::FakeClient;

void test_offline_table() {
    hint::SuggestionCache cache;
    hint::ExplainerEngine explainer(cache, nullptr);

    auto ls = explainer.explain("ls -la");
    assert(std::holds_alternative<std::string>(ls));
    assert(std::get<std::string>(ls) == hint::offlineExplanation("ls"));

    auto unknown = explainer.explain("frobnicate --all");
    assert(std::get<std::string>(unknown) == "No offline explanation available for \"frobnicate\".");

    assert(cache.contains("explain:ls -la"));

    std::cout << "[PASS] test_offline_table\n";
}

void test_empty_command() {
    hint::SuggestionCache cache;
    hint::ExplainerEngine explainer(cache, nullptr);

    auto result = explainer.explain("   ");
    assert(std::get<std::string>(result).empty());
    assert(cache.size() == 0);

    std::cout << "[PASS] test_empty_command\n";
}

void test_remote_free_text_cached() {
    FakeClient fake = FakeClient::replying("Shows disk usage per filesystem.");
    hint::InferenceAdapter adapter(fake);
    hint::SuggestionCache cache;
    hint::ExplainerEngine explainer(cache, &adapter);

    auto first = explainer.explain("df -h");
    auto second = explainer.explain("df -h");

    assert(std::get<std::string>(first) == "Shows disk usage per filesystem.");
    assert(std::get<std::string>(second) == "Shows disk usage per filesystem.");
    assert(fake.calls() == 1);

    std::cout << "[PASS] test_remote_free_text_cached\n";
}

void test_remote_failure_uses_offline_text() {
    FakeClient fake = FakeClient::failing("HTTP error: 503");
    hint::InferenceAdapter adapter(fake);
    hint::SuggestionCache cache;
    hint::ExplainerEngine explainer(cache, &adapter);

    auto result = explainer.explain("mv a b");

    assert(std::get<std::string>(result) == hint::offlineExplanation("mv"));

    std::cout << "[PASS] test_remote_failure_uses_offline_text\n";
}

void test_structured_for_preferred_commands() {
    FakeClient fake = FakeClient::replying(
        "```json\n{\"command\": \"git log\", \"purpose\": \"Show commit history\","
        " \"options\": {\"--oneline\": \"one line per commit\"}, \"examples\": []}\n```");
    hint::InferenceAdapter adapter(fake);
    hint::SuggestionCache cache;
    hint::ExplainerEngine explainer(cache, &adapter);

    auto result = explainer.explain("git log");

    assert(std::holds_alternative<hint::StructuredExplanation>(result));
    const auto& structured = std::get<hint::StructuredExplanation>(result);
    assert(structured.purpose == "Show commit history");
    assert(structured.options.count("--oneline") == 1);
    assert(cache.contains("structured:git log"));

    explainer.explain("git log");
    assert(fake.calls() == 1);

    std::cout << "[PASS] test_structured_for_preferred_commands\n";
}

void test_malformed_structured_falls_back() {
    FakeClient fake = FakeClient::replying("{\"command\": \"docker ps\", \"purpose\": ");
    hint::InferenceAdapter adapter(fake);
    hint::SuggestionCache cache;
    hint::ExplainerEngine explainer(cache, &adapter);

    auto result = explainer.explainStructured("docker ps");

    assert(result.command == "docker ps");
    assert(result.purpose == hint::offlineExplanation("docker"));
    assert(result.options.empty());
    assert(result.examples.empty());
    assert(cache.contains("structured:docker ps"));

    std::cout << "[PASS] test_malformed_structured_falls_back\n";
}

void test_structured_transport_failure_not_cached() {
    FakeClient fake = FakeClient::failing("Network error: timeout");
    hint::InferenceAdapter adapter(fake);
    hint::SuggestionCache cache;
    hint::ExplainerEngine explainer(cache, &adapter);

    auto result = explainer.explainStructured("grep -rn foo .");

    assert(result.purpose == hint::offlineExplanation("grep"));
    assert(!cache.contains("structured:grep -rn foo ."));

    explainer.explainStructured("grep -rn foo .");
    assert(fake.calls() == 2);

    std::cout << "[PASS] test_structured_transport_failure_not_cached\n";
}

int main() {
    std::cout << "Running ExplainerEngine tests...\n\n";

    test_offline_table();
    test_empty_command();
    test_remote_free_text_cached();
    test_remote_failure_uses_offline_text();
    test_structured_for_preferred_commands();
    test_malformed_structured_falls_back();
    test_structured_transport_failure_not_cached();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
