/**
 * CommandRegistry.cpp - Map command names to grammars and handlers
 */

#include "sift/CommandRegistry.hpp"

#include <map>
#include <utility>

#include "sift/Tokenizer.hpp"

namespace sift {

struct CommandRegistry::Impl {
    struct Entry {
        std::shared_ptr<Parser> parser; // shared by the name and its aliases
        Handler handler;
    };

    ParseOptions options;
    std::map<std::string, Entry> commands;
    NotFoundHandler not_found;

    explicit Impl(ParseOptions opts) : options(std::move(opts)) {
        not_found = [](const std::vector<std::string>& tokens) -> int {
            throw ParseError(Error::input("command not found: " + (tokens.empty() ? std::string() : tokens[0])));
        };
    }
};

CommandRegistry::CommandRegistry(ParseOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

CommandRegistry::~CommandRegistry() = default;

void CommandRegistry::add(const Verb& verb, Handler handler) {
    if (verb.isUnnamed()) {
        throw ParseError(Error::grammar("command '" + verb.id + "' needs a name"));
    }

    auto parser = std::make_shared<Parser>(verb, impl_->options);
    impl_->commands[verb.name] = Impl::Entry{parser, handler};
    for (const auto& alias : verb.aliases) {
        impl_->commands[alias] = Impl::Entry{parser, handler};
    }
}

void CommandRegistry::remove(const std::vector<std::string>& names) {
    for (const auto& name : names) {
        impl_->commands.erase(name);
    }
}

bool CommandRegistry::contains(const std::string& name) const {
    return impl_->commands.count(name) > 0;
}

std::vector<std::string> CommandRegistry::names() const {
    std::vector<std::string> out;
    for (const auto& entry : impl_->commands) {
        out.push_back(entry.first);
    }
    return out;
}

int CommandRegistry::dispatch(const std::vector<std::string>& tokens) const {
    if (tokens.empty()) {
        return impl_->not_found(tokens);
    }

    auto it = impl_->commands.find(tokens[0]);
    if (it == impl_->commands.end()) {
        return impl_->not_found(tokens);
    }

    ResultRecord args = it->second.parser->parseCommand(tokens);
    return it->second.handler(args);
}

int CommandRegistry::dispatchLine(const std::string& line) const {
    return dispatch(tokenize(line));
}

void CommandRegistry::setNotFoundHandler(NotFoundHandler handler) {
    impl_->not_found = std::move(handler);
}

} // namespace sift
