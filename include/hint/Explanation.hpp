/**
 * Explanation.hpp - Free-text and structured command explanations
 */

#pragma once

#include <map>
#include <string>
#include <variant>
#include <vector>

namespace hint {

struct ExampleCommand {
    std::string command;
    std::string description;    // may be empty
};

struct StructuredExplanation {
    std::string command;
    std::string purpose;
    std::map<std::string, std::string> options;
    std::vector<ExampleCommand> examples;
};

using Explanation = std::variant<std::string, StructuredExplanation>;

} // namespace hint
