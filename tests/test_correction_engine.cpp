/**
 * test_correction_engine.cpp - Unit tests for CorrectionEngine
 */

#include "hint/CorrectionEngine.hpp"

#include <cassert>
#include <iostream>

void test_typo_with_arguments() {
    hint::CorrectionEngine engine;

    auto result = engine.check("giit status");

    assert(result.has_value());
    assert(result->command == "git status");
    assert(result->type() == "typo");
    assert(result->source() == hint::SuggestionSource::TYPO);
    assert(result->score == 0.98);

    std::cout << "[PASS] test_typo_with_arguments\n";
}

void test_whole_input_typo() {
    hint::CorrectionEngine engine;

    auto result = engine.check("cd..");

    assert(result.has_value());
    assert(result->command == "cd ..");
    assert(result->type() == "typo");

    std::cout << "[PASS] test_whole_input_typo\n";
}

void test_root_delete_is_danger() {
    hint::CorrectionEngine engine;

    auto result = engine.check("rm -rf /");

    assert(result.has_value());
    assert(result->isWarning());
    assert(result->type() == "danger");
    assert(result->source() == hint::SuggestionSource::SAFETY);
    assert(result->command == "rm -rf /");
    assert(result->description.find("entire filesystem") != std::string::npos);

    assert(engine.isDangerous("sudo rm -rf /"));
    assert(engine.isDangerous("rm -fr ~"));

    std::cout << "[PASS] test_root_delete_is_danger\n";
}

void test_danger_safe_alternative() {
    hint::CorrectionEngine engine;

    auto current_dir = engine.check("rm -rf .");
    assert(current_dir.has_value());
    assert(current_dir->isWarning());
    assert(current_dir->command == "rm -rf ./specific-dir");

    auto reset = engine.check("git reset --hard HEAD~1");
    assert(reset.has_value());
    assert(reset->isWarning());
    assert(reset->command == "git stash to preserve changes");

    std::cout << "[PASS] test_danger_safe_alternative\n";
}

void test_other_danger_rules() {
    hint::CorrectionEngine engine;

    assert(engine.isDangerous("chmod -R 777 /var/www"));
    assert(engine.isDangerous("sudo chmod -R 777 /srv"));
    assert(engine.isDangerous(":wq!"));
    assert(engine.isDangerous(":(){ :|:& };:"));
    assert(engine.isDangerous("dd if=/dev/zero of=/dev/sda bs=1M"));
    assert(engine.isDangerous("mkfs.ext4 /dev/sdb1"));

    std::cout << "[PASS] test_other_danger_rules\n";
}

void test_scoped_delete_is_not_danger() {
    hint::CorrectionEngine engine;

    assert(!engine.isDangerous("rm -rf ./build"));
    assert(!engine.isDangerous("ls -la"));
    assert(!engine.check("rm -rf ./build").has_value());

    std::cout << "[PASS] test_scoped_delete_is_not_danger\n";
}

void test_syntax_corrections() {
    hint::CorrectionEngine engine;

    auto cd = engine.check("cd foo bar");
    assert(cd.has_value());
    assert(cd->command == "cd foo");
    assert(cd->type() == "syntax");

    auto commit = engine.check("git commit initial");
    assert(commit.has_value());
    assert(commit->command == "git commit -m \"initial\"");

    auto find = engine.check("find . -name *.txt");
    assert(find.has_value());
    assert(find->command == "find . -name \"*.txt\"");

    // Already quoted
    assert(!engine.check("find . -name \"*.txt\"").has_value());

    std::cout << "[PASS] test_syntax_corrections\n";
}

void test_fuzzy_command_name() {
    hint::CorrectionEngine engine;

    auto result = engine.check("dokcer ps");

    assert(result.has_value());
    assert(result->command == "docker ps");
    assert(result->type() == "fuzzy");
    assert(result->description == "Did you mean 'docker'?");
    assert(result->score == 0.96);

    std::cout << "[PASS] test_fuzzy_command_name\n";
}

void test_closest_command() {
    hint::CorrectionEngine engine;

    auto mkdir = engine.closestCommand("mkdr");
    assert(mkdir.has_value());
    assert(mkdir->command == "mkdir");
    assert(mkdir->distance == 1);

    auto upper = engine.closestCommand("GIT");
    assert(upper.has_value());
    assert(upper->command == "git");
    assert(upper->distance == 0);

    assert(!engine.closestCommand("x").has_value());
    assert(!engine.closestCommand("supercalifragilistic").has_value());

    std::cout << "[PASS] test_closest_command\n";
}

void test_known_command_has_no_correction() {
    hint::CorrectionEngine engine;

    assert(!engine.check("ls -").has_value());
    assert(!engine.check("git status").has_value());
    assert(!engine.check("").has_value());
    assert(!engine.check("   ").has_value());

    std::cout << "[PASS] test_known_command_has_no_correction\n";
}

void test_non_ascii_input() {
    hint::CorrectionEngine engine;

    auto match = engine.closestCommand("g\xC3\xAEt");
    assert(match.has_value());
    assert(match->command == "git");
    assert(match->distance == 2);

    auto correction = engine.check("g\xC3\xAEt status");
    assert(correction.has_value());
    assert(correction->command == "git status");
    assert(correction->type() == "fuzzy");

    assert(!engine.closestCommand("\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E").has_value());

    std::cout << "[PASS] test_non_ascii_input\n";
}

int main() {
    std::cout << "Running CorrectionEngine tests...\n\n";

    test_typo_with_arguments();
    test_whole_input_typo();
    test_root_delete_is_danger();
    test_danger_safe_alternative();
    test_other_danger_rules();
    test_scoped_delete_is_not_danger();
    test_syntax_corrections();
    test_fuzzy_command_name();
    test_closest_command();
    test_known_command_has_no_correction();
    test_non_ascii_input();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
