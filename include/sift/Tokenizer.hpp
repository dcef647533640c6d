/**
 * Tokenizer.hpp - Split a raw command line into tokens
 */

#pragma once

#include <string>
#include <vector>

namespace sift {

// Whitespace separates tokens; '...' and "..." group text (quotes may
// appear mid-token), and a backslash takes the next character literally.
// An unterminated quote runs to the end of the line.
std::vector<std::string> tokenize(const std::string& line);

} // namespace sift
