/**
 * Error.cpp - Parse and grammar errors
 */

#include "sift/Error.hpp"

namespace sift {

Error Error::grammar(const std::string& message) {
    return Error{Kind::GRAMMAR_DEFINITION, message};
}

Error Error::input(const std::string& message) {
    return Error{Kind::USER_INPUT, message};
}

ParseError::ParseError(const Error& error)
    : std::runtime_error(error.message), kind_(error.kind) {}

const char* kindName(Error::Kind kind) {
    switch (kind) {
        case Error::Kind::GRAMMAR_DEFINITION:
            return "grammar definition error";
        case Error::Kind::USER_INPUT:
            return "input error";
    }
    return "error";
}

} // namespace sift
