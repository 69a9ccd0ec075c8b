/**
 * CommandParser.cpp - Split shell command lines into classified tokens
 */

#include "hint/CommandParser.hpp"

#include <sstream>

namespace hint {

struct CommandParser::Impl {
    std::vector<std::string> tokenize(const std::string& input) {
        std::vector<std::string> tokens;
        std::istringstream iss(input);
        std::string token;

        bool in_quotes = false;
        char quote = '\0';
        std::string quoted_token;

        while (iss >> token) {
            if (!in_quotes && (token.front() == '"' || token.front() == '\'')) {
                quote = token.front();
                if (token.size() > 1 && token.back() == quote) {
                    tokens.push_back(token.substr(1, token.size() - 2));
                    continue;
                }
                in_quotes = true;
                quoted_token = token.substr(1);
            } else if (in_quotes) {
                if (token.back() == quote) {
                    quoted_token += " " + token.substr(0, token.size() - 1);
                    tokens.push_back(quoted_token);
                    in_quotes = false;
                } else {
                    quoted_token += " " + token;
                }
            } else {
                tokens.push_back(token);
            }
        }

        // Unterminated quote: keep what was typed so far
        if (in_quotes) {
            tokens.push_back(quoted_token);
        }

        return tokens;
    }
};

CommandParser::CommandParser() : impl_(std::make_unique<Impl>()) {}

CommandParser::~CommandParser() = default;

ParsedCommand CommandParser::parse(const std::string& input) {
    ParsedCommand result;
    result.raw_input = input;

    auto tokens = impl_->tokenize(input);

    if (tokens.empty()) {
        return result;
    }

    result.executable = tokens[0];

    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        TokenKind kind = classify(token, i == 0);
        result.tokens.push_back({token, kind});

        if (i == 0) continue;

        if (kind == TokenKind::FLAG) {
            result.flags.push_back(token);
        } else {
            result.args.push_back(token);
        }
    }

    return result;
}

TokenKind CommandParser::classify(const std::string& token, bool first) const {
    if (first) return TokenKind::NAME;
    if (token.empty()) return TokenKind::ARGUMENT;
    if (token.front() == '-') return TokenKind::FLAG;
    if (token.find('/') != std::string::npos || token.front() == '.' || token.front() == '~') {
        return TokenKind::PATH;
    }
    return TokenKind::ARGUMENT;
}

std::string baseCommand(const std::string& command) {
    std::string trimmed = trim(command);
    size_t end = trimmed.find_first_of(" \t");
    return end == std::string::npos ? trimmed : trimmed.substr(0, end);
}

std::string lastWord(const std::string& command) {
    size_t pos = command.rfind(' ');
    return pos == std::string::npos ? command : command.substr(pos + 1);
}

std::string replaceLastWord(const std::string& command, const std::string& replacement) {
    size_t pos = command.rfind(' ');
    if (pos == std::string::npos) {
        return replacement;
    }
    return command.substr(0, pos + 1) + replacement;
}

std::string replaceLastToken(const std::string& command, const std::string& token,
                             const std::string& replacement) {
    if (token.empty()) {
        return replaceLastWord(command, replacement);
    }

    std::string body = command;
    std::string closing;
    if (!body.empty() && (body.back() == '"' || body.back() == '\'')) {
        closing = body.back();
        body.pop_back();
    }

    if (body.size() >= token.size() &&
        body.compare(body.size() - token.size(), token.size(), token) == 0) {
        return body.substr(0, body.size() - token.size()) + replacement + closing;
    }
    return replaceLastWord(command, replacement);
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> splitWhitespace(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream iss(s);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

} // namespace hint
