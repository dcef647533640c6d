/**
 * Parser.cpp - Parse token lists against a validated grammar
 */

#include "sift/Parser.hpp"

#include <stdexcept>
#include <utility>

namespace sift {

struct Parser::Impl {
    const Verb* root;
    ParseOptions options;

    Impl(const Verb& verb, ParseOptions opts) : root(&verb), options(std::move(opts)) {}

    Status run(TokenStream& stream, ResultRecord& out) const {
        const size_t open_before = stream.openSnapshots();

        ParseContext ctx(stream, options);
        Status err = engine::parseVerb(ctx, *root, OptionScope(), out);

        if (stream.openSnapshots() != open_before) {
            throw std::logic_error("unbalanced token stream snapshots after parsing '" + root->id + "'");
        }
        return err;
    }
};

Parser::Parser(const Verb& root, ParseOptions options)
    : impl_(std::make_unique<Impl>(root, std::move(options))) {
    checkGrammar(root);
}

Parser::~Parser() = default;
Parser::Parser(Parser&&) noexcept = default;
Parser& Parser::operator=(Parser&&) noexcept = default;

ResultRecord Parser::parse(const std::vector<std::string>& args) const {
    TokenStream stream(args);
    ResultRecord record;
    if (auto err = impl_->run(stream, record)) {
        throw ParseError(*err);
    }
    return record;
}

ResultRecord Parser::parseCommand(const std::vector<std::string>& tokens) const {
    TokenStream stream(tokens);
    stream.consume();

    ResultRecord record;
    if (auto err = impl_->run(stream, record)) {
        throw ParseError(*err);
    }
    return record;
}

ParseResponse Parser::tryParse(const std::vector<std::string>& args) const {
    TokenStream stream(args);
    ParseResponse response{ResultRecord(), true, Error{Error::Kind::USER_INPUT, ""}};

    if (auto err = impl_->run(stream, response.record)) {
        response.success = false;
        response.error = *err;
        response.record.clear();
    }
    return response;
}

Status Parser::parse(TokenStream& stream, ResultRecord& out) const {
    return impl_->run(stream, out);
}

const Verb& Parser::root() const {
    return *impl_->root;
}

const ParseOptions& Parser::options() const {
    return impl_->options;
}

} // namespace sift
