/**
 * Grammar.hpp - Declarative verb / option / argument definitions
 *
 * A grammar is a tree of Verbs. Each verb owns its positional arguments
 * and options by value; sub-verbs are referenced by pointer so that one
 * definition can be shared between parents. The host keeps every Verb
 * alive for as long as parsers use it (a Grammar arena does this for
 * documents loaded from JSON).
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sift/Error.hpp"
#include "sift/Resolver.hpp"
#include "sift/ResultRecord.hpp"

namespace sift {

struct Argument {
    std::string id;
    ResolverPtr type;
    bool optional = false;
    std::optional<Value> default_value; // required when optional

    static Argument required(const std::string& id, ResolverPtr type);
    static Argument withDefault(const std::string& id, ResolverPtr type, Value default_value);
};

struct Option {
    std::string id;
    std::vector<std::string> names; // "--long" and/or "-s"
    std::vector<Argument> args;
};

struct Verb {
    std::string id;
    std::string name; // empty: unnamed, selected only by trial parsing
    std::vector<std::string> aliases;
    std::vector<Argument> args;
    std::vector<Option> options;
    std::vector<const Verb*> subverbs;

    bool isUnnamed() const { return name.empty(); }
    bool matches(const std::string& token) const;
};

bool isLongOptionName(const std::string& name);
bool isShortOptionName(const std::string& name);
bool allOptional(const std::vector<Argument>& args);

// Walks every verb reachable from root (cycles included) and reports the
// first authoring defect found
Status validateGrammar(const Verb& root);

// Same as validateGrammar but throws ParseError
void checkGrammar(const Verb& root);

// Maps type names used in grammar documents to resolvers
class ResolverTable {
public:
    ResolverTable(); // pre-populated with string, int, float, bool

    void add(const std::string& name, ResolverPtr resolver);
    bool contains(const std::string& name) const;

    // Accepts "name", {"enum": [...]} or {"variadic": <type>}
    ResolverPtr resolve(const Value& type) const;

private:
    std::map<std::string, ResolverPtr> resolvers_;
};

class Grammar {
public:
    Grammar();
    ~Grammar();
    Grammar(Grammar&&) noexcept;
    Grammar& operator=(Grammar&&) noexcept;
    Grammar(const Grammar&) = delete;
    Grammar& operator=(const Grammar&) = delete;

    // Document is either a single verb object or
    // { "root": "<id>", "verbs": [ ... ] }. Throws ParseError.
    static Grammar fromJson(const Value& document, const ResolverTable& table = ResolverTable());
    static Grammar load(const std::string& path, const ResolverTable& table = ResolverTable());

    // Verbs added here keep a stable address for the arena's lifetime
    Verb& add(Verb verb);
    void setRoot(const Verb& verb);

    const Verb& root() const;
    const Verb* find(const std::string& id) const;
    size_t size() const { return verbs_.size(); }

private:
    std::vector<std::unique_ptr<Verb>> verbs_;
    const Verb* root_ = nullptr;
};

} // namespace sift
