/**
 * Grammar.cpp - Grammar definitions, validation and JSON documents
 */

#include "sift/Grammar.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <utility>

namespace sift {

Argument Argument::required(const std::string& id, ResolverPtr type) {
    return Argument{id, std::move(type), false, std::nullopt};
}

Argument Argument::withDefault(const std::string& id, ResolverPtr type, Value default_value) {
    return Argument{id, std::move(type), true, std::move(default_value)};
}

bool Verb::matches(const std::string& token) const {
    if (isUnnamed()) return false;
    return name == token || std::find(aliases.begin(), aliases.end(), token) != aliases.end();
}

bool isLongOptionName(const std::string& name) {
    return name.size() > 2 && name.compare(0, 2, "--") == 0 && name.find('=') == std::string::npos;
}

bool isShortOptionName(const std::string& name) {
    return name.size() == 2 && name[0] == '-' && name[1] != '-';
}

bool allOptional(const std::vector<Argument>& args) {
    return std::all_of(args.begin(), args.end(), [](const Argument& arg) { return arg.optional; });
}

namespace {

Status checkArguments(const std::vector<Argument>& args, const std::string& owner) {
    bool seen_optional = false;
    for (const auto& arg : args) {
        if (arg.id.empty()) {
            return Error::grammar("argument without an id in " + owner);
        }
        if (!arg.type) {
            return Error::grammar("argument '" + arg.id + "' in " + owner + " has no type");
        }
        if (!arg.optional && seen_optional) {
            return Error::grammar("required argument '" + arg.id + "' follows an optional one in " + owner);
        }
        if (arg.optional && !arg.default_value) {
            return Error::grammar("optional argument '" + arg.id + "' in " + owner + " has no default");
        }
        seen_optional = seen_optional || arg.optional;
    }
    return std::nullopt;
}

Status checkVerb(const Verb& verb, std::set<const Verb*>& visited) {
    if (!visited.insert(&verb).second) {
        return std::nullopt;
    }
    if (verb.id.empty()) {
        return Error::grammar("verb without an id" + (verb.name.empty() ? "" : ": " + verb.name));
    }

    const std::string owner = "verb '" + verb.id + "'";
    if (auto err = checkArguments(verb.args, owner)) {
        return err;
    }

    std::set<std::string> names;
    for (const auto& option : verb.options) {
        if (option.id.empty()) {
            return Error::grammar("option without an id in " + owner);
        }
        if (option.names.empty()) {
            return Error::grammar("option '" + option.id + "' in " + owner + " has no names");
        }
        for (const auto& name : option.names) {
            if (!isLongOptionName(name) && !isShortOptionName(name)) {
                return Error::grammar("malformed option name '" + name + "' in " + owner);
            }
            if (!names.insert(name).second) {
                return Error::grammar("duplicate option name '" + name + "' in " + owner);
            }
        }
        if (auto err = checkArguments(option.args, "option '" + option.id + "'")) {
            return err;
        }
    }

    for (const Verb* sub : verb.subverbs) {
        if (sub == nullptr) {
            return Error::grammar("null sub-verb in " + owner);
        }
        if (auto err = checkVerb(*sub, visited)) {
            return err;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

Status validateGrammar(const Verb& root) {
    std::set<const Verb*> visited;
    return checkVerb(root, visited);
}

void checkGrammar(const Verb& root) {
    if (auto err = validateGrammar(root)) {
        throw ParseError(*err);
    }
}

// ---------------------------------------------------------------------------
// ResolverTable
// ---------------------------------------------------------------------------

ResolverTable::ResolverTable() {
    resolvers_["string"] = types::string();
    resolvers_["int"] = types::integer();
    resolvers_["float"] = types::floating();
    resolvers_["bool"] = types::boolean();
}

void ResolverTable::add(const std::string& name, ResolverPtr resolver) {
    resolvers_[name] = std::move(resolver);
}

bool ResolverTable::contains(const std::string& name) const {
    return resolvers_.count(name) > 0;
}

ResolverPtr ResolverTable::resolve(const Value& type) const {
    if (type.is_string()) {
        auto it = resolvers_.find(type.get<std::string>());
        if (it == resolvers_.end()) {
            throw ParseError(Error::grammar("unknown argument type '" + type.get<std::string>() + "'"));
        }
        return it->second;
    }
    if (type.is_object() && type.contains("enum")) {
        return types::oneOf(type.at("enum").get<std::vector<std::string>>());
    }
    if (type.is_object() && type.contains("variadic")) {
        return types::variadic(resolve(type.at("variadic")));
    }
    throw ParseError(Error::grammar("unsupported argument type " + type.dump()));
}

// ---------------------------------------------------------------------------
// Grammar
// ---------------------------------------------------------------------------

namespace {

struct PendingRef {
    Verb* parent;
    size_t slot;
    std::string id;
};

class DocumentReader {
public:
    DocumentReader(Grammar& grammar, const ResolverTable& table)
        : grammar_(grammar), table_(table) {}

    Verb& declare(const Value& node) {
        if (!node.is_object()) {
            throw ParseError(Error::grammar("verb must be an object, got " + node.dump()));
        }

        Verb verb;
        verb.id = node.at("id").get<std::string>();
        verb.name = node.value("name", std::string());
        verb.aliases = node.value("aliases", std::vector<std::string>());
        verb.args = readArguments(node, "verb '" + verb.id + "'");

        if (node.contains("options")) {
            for (const auto& item : node.at("options")) {
                Option option;
                option.id = item.at("id").get<std::string>();
                option.names = item.at("names").get<std::vector<std::string>>();
                option.args = readArguments(item, "option '" + option.id + "'");
                verb.options.push_back(std::move(option));
            }
        }

        if (by_id_.count(verb.id)) {
            throw ParseError(Error::grammar("duplicate verb id '" + verb.id + "'"));
        }
        Verb& stored = grammar_.add(std::move(verb));
        by_id_[stored.id] = &stored;

        if (node.contains("subverbs")) {
            for (const auto& item : node.at("subverbs")) {
                if (item.is_string()) {
                    pending_.push_back(PendingRef{&stored, stored.subverbs.size(), item.get<std::string>()});
                    stored.subverbs.push_back(nullptr);
                } else {
                    stored.subverbs.push_back(&declare(item));
                }
            }
        }
        return stored;
    }

    void link() {
        for (const auto& ref : pending_) {
            auto it = by_id_.find(ref.id);
            if (it == by_id_.end()) {
                throw ParseError(Error::grammar("verb '" + ref.parent->id +
                                                "' refers to unknown sub-verb '" + ref.id + "'"));
            }
            ref.parent->subverbs[ref.slot] = it->second;
        }
    }

private:
    Grammar& grammar_;
    const ResolverTable& table_;
    std::map<std::string, Verb*> by_id_;
    std::vector<PendingRef> pending_;

    std::vector<Argument> readArguments(const Value& node, const std::string& owner) {
        std::vector<Argument> args;
        if (!node.contains("args")) {
            return args;
        }
        for (const auto& item : node.at("args")) {
            Argument arg;
            arg.id = item.at("id").get<std::string>();
            arg.type = table_.resolve(item.contains("type") ? item.at("type") : Value("string"));
            arg.optional = item.value("optional", false);
            if (arg.optional) {
                if (!item.contains("default")) {
                    throw ParseError(Error::grammar("optional argument '" + arg.id + "' in " + owner +
                                                    " has no default"));
                }
                arg.default_value = item.at("default");
            }
            args.push_back(std::move(arg));
        }
        return args;
    }
};

} // anonymous namespace

Grammar::Grammar() = default;
Grammar::~Grammar() = default;
Grammar::Grammar(Grammar&&) noexcept = default;
Grammar& Grammar::operator=(Grammar&&) noexcept = default;

Grammar Grammar::fromJson(const Value& document, const ResolverTable& table) {
    Grammar grammar;
    DocumentReader reader(grammar, table);

    try {
        if (document.is_object() && document.contains("verbs")) {
            const Verb* first = nullptr;
            for (const auto& node : document.at("verbs")) {
                Verb& verb = reader.declare(node);
                if (!first) first = &verb;
            }
            reader.link();

            if (document.contains("root")) {
                const Verb* root = grammar.find(document.at("root").get<std::string>());
                if (!root) {
                    throw ParseError(Error::grammar("root verb '" + document.at("root").get<std::string>() +
                                                    "' is not declared"));
                }
                grammar.setRoot(*root);
            } else if (first) {
                grammar.setRoot(*first);
            }
        } else {
            grammar.setRoot(reader.declare(document));
            reader.link();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ParseError(Error::grammar(std::string("malformed grammar document: ") + e.what()));
    }

    if (!grammar.root_) {
        throw ParseError(Error::grammar("grammar document declares no verbs"));
    }
    checkGrammar(grammar.root());
    return grammar;
}

Grammar Grammar::load(const std::string& path, const ResolverTable& table) {
    std::ifstream file(path);
    if (!file.good()) {
        throw std::runtime_error("cannot open grammar file: " + path);
    }

    Value document;
    try {
        file >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(Error::grammar(path + ": " + e.what()));
    }
    return fromJson(document, table);
}

Verb& Grammar::add(Verb verb) {
    verbs_.push_back(std::make_unique<Verb>(std::move(verb)));
    return *verbs_.back();
}

void Grammar::setRoot(const Verb& verb) {
    root_ = &verb;
}

const Verb& Grammar::root() const {
    if (!root_) {
        throw std::logic_error("grammar has no root verb");
    }
    return *root_;
}

const Verb* Grammar::find(const std::string& id) const {
    for (const auto& verb : verbs_) {
        if (verb->id == id) {
            return verb.get();
        }
    }
    return nullptr;
}

} // namespace sift
