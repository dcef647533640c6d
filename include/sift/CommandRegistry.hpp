/**
 * CommandRegistry.hpp - Map command names to grammars and handlers
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "sift/Grammar.hpp"
#include "sift/Parser.hpp"
#include "sift/ResultRecord.hpp"

namespace sift {

class CommandRegistry {
public:
    using Handler = std::function<int(const ResultRecord& args)>;
    using NotFoundHandler = std::function<int(const std::vector<std::string>& tokens)>;

    explicit CommandRegistry(ParseOptions options = ParseOptions());
    ~CommandRegistry();

    // Validates verb's grammar (throws ParseError) and registers it under
    // its name and aliases, replacing earlier registrations of those names
    void add(const Verb& verb, Handler handler);
    void remove(const std::vector<std::string>& names);
    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;

    // tokens[0] selects the command. Parse failures throw ParseError.
    int dispatch(const std::vector<std::string>& tokens) const;
    int dispatchLine(const std::string& line) const;

    // Default throws a USER_INPUT ParseError "command not found: <name>"
    void setNotFoundHandler(NotFoundHandler handler);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sift
