/**
 * Tokenizer.cpp - Split a raw command line into tokens
 */

#include "sift/Tokenizer.hpp"

#include <cctype>

namespace sift {

std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::string token;
    bool has_token = false; // "" is still a token
    bool escaped = false;
    char quote = 0;

    auto flush = [&]() {
        if (has_token) {
            tokens.push_back(token);
            token.clear();
            has_token = false;
        }
    };

    for (char c : line) {
        if (escaped) {
            token += c;
            escaped = false;
            continue;
        }

        if (c == '\\') {
            has_token = true;
            escaped = true;
            continue;
        }

        if (quote ? c == quote : (c == '"' || c == '\'')) {
            quote = quote ? 0 : c;
            has_token = true;
            continue;
        }

        if (!quote && std::isspace(static_cast<unsigned char>(c))) {
            flush();
            continue;
        }

        has_token = true;
        token += c;
    }

    flush();
    return tokens;
}

} // namespace sift
