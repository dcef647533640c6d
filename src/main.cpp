/**
 * main.cpp - sift CLI entry point
 *
 * Usage:
 *   sift grammar.json -- mv a.txt b.txt          # Parse tokens, print JSON
 *   sift grammar.json --line "mv 'a b' c"         # Tokenize a raw line first
 *   sift grammar.json --check                     # Validate the grammar only
 *   sift grammar.json --trace -- git commit -am x # Show backtracking on stderr
 */

#include "sift/Engine.hpp"
#include "sift/Error.hpp"
#include "sift/Grammar.hpp"
#include "sift/Parser.hpp"
#include "sift/Resolver.hpp"
#include "sift/Tokenizer.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string GREEN = "\033[32m";
const std::string RED = "\033[31m";

const int EXIT_INPUT = 1;
const int EXIT_GRAMMAR = 2;
const int EXIT_IO = 3;

// The CLI's own command line, parsed with sift
sift::Verb buildCliGrammar() {
    sift::Verb cli;
    cli.id = "sift";
    cli.name = "sift";
    cli.args = {
        sift::Argument::withDefault("grammar", sift::types::string(), ""),
        sift::Argument::withDefault("tokens", sift::types::variadic(sift::types::string()),
                                    sift::Value::array()),
    };
    cli.options = {
        {"help", {"--help", "-h"}, {}},
        {"trace", {"--trace", "-t"}, {}},
        {"pretty", {"--pretty", "-p"}, {}},
        {"check", {"--check", "-c"}, {}},
        {"line", {"--line", "-l"}, {sift::Argument::required("line_text", sift::types::string())}},
        {"max-trials", {"--max-trials"}, {sift::Argument::required("trials", sift::types::integer())}},
        {"max-depth", {"--max-depth"}, {sift::Argument::required("depth", sift::types::integer())}},
    };
    return cli;
}

size_t envLimit(const char* name, size_t fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return fallback;
    }
    if (auto limit = sift::parseLimit(value)) {
        return *limit;
    }
    std::cerr << RED << "Ignoring invalid " << name << "='" << value << "'" << RESET << "\n";
    return fallback;
}

bool envFlag(const char* name) {
    const char* value = std::getenv(name);
    return value && *value && std::string(value) != "0";
}

size_t positiveLimit(const sift::ResultRecord& args, const std::string& id, size_t fallback) {
    if (!args.has(id)) {
        return fallback;
    }
    long long value = args.get<long long>(id);
    if (value <= 0) {
        throw sift::ParseError(sift::Error::input(id + " must be positive"));
    }
    return static_cast<size_t>(value);
}

void printUsage() {
    std::cout << BOLD << "sift" << RESET << " - parse command tokens against a JSON grammar\n\n"
              << BOLD << "Usage:" << RESET << "\n"
              << "  sift <grammar.json> [options] [--] <command> [tokens...]\n\n"
              << BOLD << "Options:" << RESET << "\n"
              << "  -l, --line <text>      Tokenize <text> instead of reading tokens\n"
              << "  -c, --check            Only validate the grammar\n"
              << "  -p, --pretty           Indent the JSON result\n"
              << "  -t, --trace            Print backtracking decisions to stderr\n"
              << "      --max-trials <n>   Limit unnamed sub-verb trials (SIFT_MAX_TRIALS)\n"
              << "      --max-depth <n>    Limit verb nesting (SIFT_MAX_DEPTH)\n"
              << "  -h, --help             Show this help\n\n"
              << "Tokens that start with '-' must follow '--' so they are not read as sift options.\n"
              << "The first token is the command name and is not matched against the grammar.\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> argv_tokens(argv, argv + argc);

    const sift::Verb cli_grammar = buildCliGrammar();
    sift::ResultRecord cli;
    try {
        cli = sift::Parser(cli_grammar).parseCommand(argv_tokens);
    } catch (const sift::ParseError& e) {
        std::cerr << RED << "Error: " << e.what() << RESET << "\n";
        std::cerr << "Run 'sift --help' for usage.\n";
        return EXIT_INPUT;
    }

    if (cli.count("help") > 0) {
        printUsage();
        return 0;
    }

    const std::string grammar_path = cli.get<std::string>("grammar");
    if (grammar_path.empty()) {
        std::cerr << RED << "Error: No grammar file provided." << RESET << "\n";
        printUsage();
        return EXIT_INPUT;
    }

    sift::ParseOptions options;
    try {
        options.limits.max_trials = positiveLimit(cli, "trials", envLimit("SIFT_MAX_TRIALS", options.limits.max_trials));
        options.limits.max_depth = positiveLimit(cli, "depth", envLimit("SIFT_MAX_DEPTH", options.limits.max_depth));
    } catch (const sift::ParseError& e) {
        std::cerr << RED << "Error: " << e.what() << RESET << "\n";
        return EXIT_INPUT;
    }
    if (cli.count("trace") > 0 || envFlag("SIFT_TRACE")) {
        options.trace = &std::cerr;
    }

    sift::Grammar grammar;
    try {
        grammar = sift::Grammar::load(grammar_path);
    } catch (const sift::ParseError& e) {
        std::cerr << RED << "Grammar error: " << e.what() << RESET << "\n";
        return EXIT_GRAMMAR;
    } catch (const std::runtime_error& e) {
        std::cerr << RED << "Error: " << e.what() << RESET << "\n";
        return EXIT_IO;
    }

    if (cli.count("check") > 0) {
        std::cout << GREEN << "Grammar OK: " << grammar.size() << " verb(s), root '"
                  << grammar.root().id << "'" << RESET << "\n";
        return 0;
    }

    std::vector<std::string> tokens;
    if (cli.count("line") > 0) {
        tokens = sift::tokenize(cli.get<std::string>("line_text"));
    } else {
        tokens = cli.get<std::vector<std::string>>("tokens");
    }

    sift::Parser parser(grammar.root(), options);
    try {
        sift::ResultRecord result = parser.parseCommand(tokens);
        std::cout << result.json().dump(cli.count("pretty") > 0 ? 2 : -1) << "\n";
    } catch (const sift::ParseError& e) {
        std::cerr << RED << sift::kindName(e.kind()) << ": " << e.what() << RESET << "\n";
        return e.isGrammarError() ? EXIT_GRAMMAR : EXIT_INPUT;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << RED << "Error: cannot print result: " << e.what() << RESET << "\n";
        return EXIT_IO;
    }

    return 0;
}
