/**
 * Engine.hpp - Recursive-descent parse steps
 *
 * Every step reports failure through its Status instead of throwing, so
 * the backtracking regions (optional option-arguments and unnamed
 * sub-verb trials) can inspect the outcome and roll the stream back.
 * Values are only written to a ResultRecord after they parsed
 * successfully; a failed trial leaves its caller's record untouched.
 *
 * An option is counted in the record of the verb whose scan consumed it.
 * When an unnamed sub-verb consumes an inherited option, the declaring
 * verb leaves that counter unbound instead of reporting 0.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include "sift/Error.hpp"
#include "sift/Grammar.hpp"
#include "sift/ResultRecord.hpp"
#include "sift/TokenStream.hpp"

namespace sift {

struct ParseLimits {
    size_t max_trials = 4096; // unnamed sub-verb attempts per parse
    size_t max_depth = 256;   // verb nesting
};

// Reads a limit such as "4096"; empty unless the whole text is a positive integer
std::optional<size_t> parseLimit(const std::string& text);

struct ParseOptions {
    ParseLimits limits;
    std::ostream* trace = nullptr; // backtracking trace, off when null
};

struct ParseContext {
    TokenStream& stream;
    const ParseOptions& options;
    size_t trials = 0;
    size_t depth = 0;
    // Set when a limit is hit; no backtracking region may recover from it
    bool aborted = false;

    ParseContext(TokenStream& s, const ParseOptions& o) : stream(s), options(o) {}

    void trace(const std::string& message) const;
};

// Options visible while parsing a verb, innermost first
using OptionScope = std::vector<const Option*>;

namespace engine {

Status parseArgument(ParseContext& ctx, ResultRecord& out, const Argument& arg, bool mandatory = false);

Status parseOptionArguments(ParseContext& ctx, ResultRecord& out, const Option& option,
                            const std::string& used_name, bool adjacency);

// Both expect the current token to be an option token of their form
Status parseLongOption(ParseContext& ctx, ResultRecord& out, const OptionScope& scope);
Status parseShortOption(ParseContext& ctx, ResultRecord& out, const OptionScope& scope);

Status parseVerb(ParseContext& ctx, const Verb& verb, const OptionScope& inherited, ResultRecord& out);

Status parseSubVerb(ParseContext& ctx, const Verb& verb, const OptionScope& scope, ResultRecord& out);

Status fillDefaults(ParseContext& ctx, const Verb& verb, ResultRecord& out, size_t next_arg,
                    bool fill_subverb, std::set<const Verb*>& visited);

const Option* findOption(const OptionScope& scope, const std::string& name);

} // namespace engine

} // namespace sift
