/**
 * test_log.cpp - Unit tests for the diagnostics log
 */

#include "hint/Log.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using hint::log::Level;

void test_line_format() {
    std::vector<std::string> lines;
    hint::log::setLevel(Level::DEBUG);
    hint::log::setSink([&](Level, const std::string& line) { lines.push_back(line); });

    hint::log::warn("engine", "remote call failed");
    hint::log::debug("cache", "hit");

    hint::log::setSink(nullptr);

    assert(lines.size() == 2);
    assert(lines[0] == "[hint] WARN engine: remote call failed");
    assert(lines[1] == "[hint] DEBUG cache: hit");

    std::cout << "[PASS] test_line_format\n";
}

void test_threshold() {
    std::vector<Level> levels;
    hint::log::setLevel(Level::WARN);
    hint::log::setSink([&](Level level, const std::string&) { levels.push_back(level); });

    hint::log::debug("x", "dropped");
    hint::log::info("x", "dropped");
    hint::log::warn("x", "kept");
    hint::log::error("x", "kept");

    hint::log::setLevel(Level::OFF);
    hint::log::error("x", "dropped");

    hint::log::setSink(nullptr);
    hint::log::setLevel(Level::WARN);

    assert(levels.size() == 2);
    assert(levels[0] == Level::WARN);
    assert(levels[1] == Level::ERROR);
    assert(hint::log::level() == Level::WARN);

    std::cout << "[PASS] test_threshold\n";
}

void test_parse_level() {
    assert(hint::log::parseLevel("debug", Level::WARN) == Level::DEBUG);
    assert(hint::log::parseLevel("INFO", Level::WARN) == Level::INFO);
    assert(hint::log::parseLevel("warning", Level::ERROR) == Level::WARN);
    assert(hint::log::parseLevel("Error", Level::WARN) == Level::ERROR);
    assert(hint::log::parseLevel("off", Level::WARN) == Level::OFF);
    assert(hint::log::parseLevel("verbose", Level::INFO) == Level::INFO);
    assert(hint::log::parseLevel("", Level::WARN) == Level::WARN);

    std::cout << "[PASS] test_parse_level\n";
}

int main() {
    std::cout << "Running Log tests...\n\n";

    test_line_format();
    test_threshold();
    test_parse_level();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
