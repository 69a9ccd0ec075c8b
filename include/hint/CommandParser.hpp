/**
 * CommandParser.hpp - Split shell command lines into classified tokens
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace hint {

enum class TokenKind {
    NAME,       // First token, the executable
    FLAG,       // Starts with '-'
    PATH,       // Contains '/' or starts with '.' or '~'
    ARGUMENT
};

struct CommandToken {
    std::string text;
    TokenKind kind;
};

struct ParsedCommand {
    std::string executable;
    std::vector<std::string> args;
    std::vector<std::string> flags;
    std::vector<CommandToken> tokens;
    std::string raw_input;
};

class CommandParser {
public:
    CommandParser();
    ~CommandParser();

    ParsedCommand parse(const std::string& input);
    TokenKind classify(const std::string& token, bool first) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// First whitespace-delimited token ("git" for "git status")
std::string baseCommand(const std::string& command);

// Text after the last single space; the whole string when there is none
std::string lastWord(const std::string& command);

// Swap the text after the last single space for replacement
std::string replaceLastWord(const std::string& command, const std::string& replacement);

// Swap the text of the trailing parsed token for replacement, leaving any quotes around it
std::string replaceLastToken(const std::string& command, const std::string& token,
                             const std::string& replacement);

std::string trim(const std::string& s);
bool startsWith(const std::string& s, const std::string& prefix);
std::vector<std::string> splitWhitespace(const std::string& s);

} // namespace hint
