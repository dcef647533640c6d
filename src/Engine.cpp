/**
 * Engine.cpp - Recursive-descent parse steps
 */

#include "sift/Engine.hpp"

#include <algorithm>
#include <stdexcept>

namespace sift {

void ParseContext::trace(const std::string& message) const {
    if (options.trace) {
        *options.trace << "[sift] " << std::string(depth * 2, ' ') << message << "\n";
    }
}

std::optional<size_t> parseLimit(const std::string& text) {
    try {
        size_t end = 0;
        long long value = std::stoll(text, &end);
        if (end != text.size() || value <= 0) {
            return std::nullopt;
        }
        return static_cast<size_t>(value);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

namespace engine {

namespace {

const std::string INSUFFICIENT = "insufficient arguments";

struct DepthGuard {
    size_t& depth;
    explicit DepthGuard(size_t& d) : depth(d) { ++depth; }
    ~DepthGuard() { --depth; }
};

bool isOptionToken(const std::string& token) {
    return token.size() > 1 && token[0] == '-';
}

Status bindDefault(ResultRecord& out, const Argument& arg, const std::string& owner) {
    if (!arg.default_value) {
        return Error::grammar("optional argument '" + arg.id + "' in " + owner + " has no default");
    }
    out.set(arg.id, *arg.default_value);
    return std::nullopt;
}

bool declaresOption(const Verb& verb, const std::string& id) {
    return std::any_of(verb.options.begin(), verb.options.end(),
                       [&id](const Option& option) { return option.id == id; });
}

// An inherited option is counted in the record of the unnamed sub-verb that
// consumed it, possibly several unnamed levels down
bool consumedBelow(const Verb& verb, const ResultRecord& out, const std::string& option_id) {
    for (const Verb* sub : verb.subverbs) {
        if (!sub->isUnnamed() || !out.hasRecord(sub->id) || declaresOption(*sub, option_id)) {
            continue;
        }
        ResultRecord nested = out.record(sub->id);
        if (nested.count(option_id) > 0 || consumedBelow(*sub, nested, option_id)) {
            return true;
        }
    }
    return false;
}

// Counters for options that never occurred, then mark the verb as matched
void finishVerb(const Verb& verb, ResultRecord& out) {
    for (const auto& option : verb.options) {
        if (!out.has(option.id) && !consumedBelow(verb, out, option.id)) {
            out.set(option.id, 0);
        }
    }
    out.set(verb.id, true);
}

} // anonymous namespace

const Option* findOption(const OptionScope& scope, const std::string& name) {
    for (const Option* option : scope) {
        if (std::find(option->names.begin(), option->names.end(), name) != option->names.end()) {
            return option;
        }
    }
    return nullptr;
}

Status parseArgument(ParseContext& ctx, ResultRecord& out, const Argument& arg, bool mandatory) {
    if (ctx.stream.isEnd() && (mandatory || !arg.optional)) {
        return Error::input(INSUFFICIENT);
    }

    Resolution resolved = arg.type->resolve(ctx.stream);
    if (!resolved.success) {
        return Error::input(resolved.error);
    }
    out.set(arg.id, std::move(resolved.value));
    return std::nullopt;
}

Status parseOptionArguments(ParseContext& ctx, ResultRecord& out, const Option& option,
                            const std::string& used_name, bool adjacency) {
    if (adjacency && option.args.empty()) {
        return Error::input("option " + used_name + " does not need any argument");
    }

    bool defaults_only = false;
    for (size_t i = 0; i < option.args.size(); ++i) {
        const Argument& arg = option.args[i];

        if (defaults_only) {
            if (!arg.optional) {
                return Error::grammar("required argument '" + arg.id + "' follows an optional one in option '" +
                                      option.id + "'");
            }
            if (auto err = bindDefault(out, arg, "option '" + option.id + "'")) {
                return err;
            }
            continue;
        }

        // The attached value of --opt=VAL / -oVAL always belongs to the first argument
        bool mandatory = !arg.optional || (adjacency && i == 0);
        if (mandatory) {
            if (auto err = parseArgument(ctx, out, arg, true)) {
                return err;
            }
            continue;
        }

        ScopedSnapshot attempt(ctx.stream);
        Status err = parseArgument(ctx, out, arg);
        if (!err) {
            attempt.commit();
            continue;
        }
        attempt.rollback();

        ctx.trace("option " + used_name + ": '" + arg.id + "' takes its default (" + err->message + ")");
        defaults_only = true;
        if (auto bad = bindDefault(out, arg, "option '" + option.id + "'")) {
            return bad;
        }
    }
    return std::nullopt;
}

Status parseLongOption(ParseContext& ctx, ResultRecord& out, const OptionScope& scope) {
    const std::string token = ctx.stream.current().value_or("");
    const size_t eq = token.find('=');
    const std::string name = token.substr(0, eq);
    const bool adjacency = eq != std::string::npos;

    // --name=value becomes "--name" "value"
    ctx.stream.replace(name);
    ctx.stream.consume();
    if (adjacency) {
        ctx.stream.insert(token.substr(eq + 1));
    }

    const Option* option = findOption(scope, name);
    if (!option) {
        return Error::input("unknown option: " + name);
    }

    out.increment(option->id);
    return parseOptionArguments(ctx, out, *option, name, adjacency);
}

Status parseShortOption(ParseContext& ctx, ResultRecord& out, const OptionScope& scope) {
    const std::string token = ctx.stream.current().value_or("");
    ctx.stream.consume();

    for (size_t i = 1; i < token.size(); ++i) {
        const std::string name = std::string("-") + token[i];
        const Option* option = findOption(scope, name);
        if (!option) {
            return Error::input("unknown option: " + name);
        }

        out.increment(option->id);
        if (option->args.empty()) {
            continue;
        }

        // -oVALUE: the rest of the cluster is the option's first argument
        const std::string rest = token.substr(i + 1);
        if (!rest.empty()) {
            ctx.stream.insert(rest);
        }
        return parseOptionArguments(ctx, out, *option, name, !rest.empty());
    }
    return std::nullopt;
}

Status parseVerb(ParseContext& ctx, const Verb& verb, const OptionScope& inherited, ResultRecord& out) {
    if (ctx.depth >= ctx.options.limits.max_depth) {
        ctx.aborted = true;
        return Error::input("verb nesting exceeds " + std::to_string(ctx.options.limits.max_depth) + " levels");
    }
    DepthGuard guard(ctx.depth);

    OptionScope scope;
    for (const auto& option : verb.options) {
        scope.push_back(&option);
    }
    scope.insert(scope.end(), inherited.begin(), inherited.end());

    size_t next_arg = 0;
    bool options_enabled = true;
    bool found_subverb = false;

    while (!ctx.stream.isEnd()) {
        const std::string token = *ctx.stream.current();

        if (options_enabled && isOptionToken(token)) {
            if (token == "--") {
                ctx.stream.consume();
                options_enabled = false;
                continue;
            }
            Status err = token[1] == '-' ? parseLongOption(ctx, out, scope)
                                         : parseShortOption(ctx, out, scope);
            if (err) {
                return err;
            }
            continue;
        }

        if (next_arg < verb.args.size()) {
            if (auto err = parseArgument(ctx, out, verb.args[next_arg++])) {
                return err;
            }
            continue;
        }

        if (!verb.subverbs.empty()) {
            if (auto err = parseSubVerb(ctx, verb, scope, out)) {
                return err;
            }
            found_subverb = true;
            break;
        }

        return Error::input("too many arguments: " + token);
    }

    std::set<const Verb*> visited;
    if (auto err = fillDefaults(ctx, verb, out, next_arg, !found_subverb, visited)) {
        return err;
    }
    finishVerb(verb, out);
    return std::nullopt;
}

Status parseSubVerb(ParseContext& ctx, const Verb& verb, const OptionScope& scope, ResultRecord& out) {
    const std::string token = ctx.stream.current().value_or("");
    std::vector<const Verb*> unnamed;

    for (const Verb* sub : verb.subverbs) {
        if (sub->isUnnamed()) {
            unnamed.push_back(sub);
            continue;
        }
        if (!sub->matches(token)) {
            continue;
        }

        ctx.stream.consume();
        ResultRecord nested;
        if (auto err = parseVerb(ctx, *sub, OptionScope(), nested)) {
            return err;
        }
        out.set(sub->id, nested);
        return std::nullopt;
    }

    if (unnamed.empty()) {
        return Error::input("unknown subcommand: " + token);
    }

    // Unnamed sub-verbs inherit the options visible here
    Status first_error;
    for (const Verb* sub : unnamed) {
        if (++ctx.trials > ctx.options.limits.max_trials) {
            ctx.aborted = true;
            return Error::input("parse aborted after " + std::to_string(ctx.options.limits.max_trials) +
                                " sub-verb trials");
        }

        ScopedSnapshot attempt(ctx.stream);
        ResultRecord nested;
        Status err = parseVerb(ctx, *sub, scope, nested);
        if (!err) {
            attempt.commit();
            out.set(sub->id, nested);
            return std::nullopt;
        }
        attempt.rollback();

        if (ctx.aborted || err->kind == Error::Kind::GRAMMAR_DEFINITION) {
            return err;
        }
        ctx.trace("sub-verb '" + sub->id + "' rejected at '" + token + "': " + err->message);
        if (!first_error) {
            first_error = err;
        }
    }
    return first_error;
}

Status fillDefaults(ParseContext& ctx, const Verb& verb, ResultRecord& out, size_t next_arg,
                    bool fill_subverb, std::set<const Verb*>& visited) {
    visited.insert(&verb);

    bool seen_optional = std::any_of(verb.args.begin(), verb.args.begin() + static_cast<std::ptrdiff_t>(next_arg),
                                     [](const Argument& arg) { return arg.optional; });
    for (size_t i = next_arg; i < verb.args.size(); ++i) {
        const Argument& arg = verb.args[i];
        if (!arg.optional) {
            if (seen_optional) {
                return Error::grammar("required argument '" + arg.id + "' follows an optional one in verb '" +
                                      verb.id + "'");
            }
            return Error::input(INSUFFICIENT);
        }
        seen_optional = true;
        if (auto err = bindDefault(out, arg, "verb '" + verb.id + "'")) {
            return err;
        }
    }

    if (!fill_subverb) {
        return std::nullopt;
    }

    // Only an unnamed sub-verb that needs no user input can stand in for a
    // missing sub-verb token
    for (const Verb* sub : verb.subverbs) {
        if (!sub->isUnnamed() || !allOptional(sub->args)) {
            continue;
        }
        if (!visited.count(sub)) {
            ctx.trace("sub-verb '" + sub->id + "' filled from defaults");
            ResultRecord nested;
            if (auto err = fillDefaults(ctx, *sub, nested, 0, true, visited)) {
                return err;
            }
            finishVerb(*sub, nested);
            out.set(sub->id, nested);
        }
        break;
    }
    return std::nullopt;
}

} // namespace engine

} // namespace sift
