/**
 * Parser.hpp - Parse token lists against a validated grammar
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sift/Engine.hpp"
#include "sift/Error.hpp"
#include "sift/Grammar.hpp"
#include "sift/ResultRecord.hpp"
#include "sift/TokenStream.hpp"

namespace sift {

struct ParseResponse {
    ResultRecord record;
    bool success;
    Error error;
};

class Parser {
public:
    // Validates the grammar reachable from root; throws ParseError on an
    // authoring defect. root must outlive the parser.
    explicit Parser(const Verb& root, ParseOptions options = ParseOptions());
    ~Parser();

    Parser(Parser&&) noexcept;
    Parser& operator=(Parser&&) noexcept;

    // Arguments only, without the command name. Throws ParseError.
    ResultRecord parse(const std::vector<std::string>& args) const;

    // Full command line; the first token is the command name and is skipped
    ResultRecord parseCommand(const std::vector<std::string>& tokens) const;

    ParseResponse tryParse(const std::vector<std::string>& args) const;

    // Parses whatever remains of stream into out
    Status parse(TokenStream& stream, ResultRecord& out) const;

    const Verb& root() const;
    const ParseOptions& options() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sift
