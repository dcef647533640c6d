/**
 * Error.hpp - Parse and grammar errors
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace sift {

struct Error {
    enum class Kind {
        GRAMMAR_DEFINITION, // The grammar itself is malformed
        USER_INPUT          // The tokens do not match the grammar
    };
    Kind kind;
    std::string message;

    static Error grammar(const std::string& message);
    static Error input(const std::string& message);
};

// Result of a parse step: empty on success
using Status = std::optional<Error>;

class ParseError : public std::runtime_error {
public:
    explicit ParseError(const Error& error);

    Error::Kind kind() const { return kind_; }
    bool isGrammarError() const { return kind_ == Error::Kind::GRAMMAR_DEFINITION; }

private:
    Error::Kind kind_;
};

const char* kindName(Error::Kind kind);

} // namespace sift
