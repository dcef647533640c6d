/**
 * test_resolvers.cpp - Unit tests for the built-in type resolvers
 */

#include "sift/Resolver.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <locale>
#include <stdexcept>

namespace {

sift::Resolution run(const sift::ResolverPtr& resolver, std::vector<std::string> tokens) {
    sift::TokenStream stream(std::move(tokens));
    return resolver->resolve(stream);
}

} // anonymous namespace

void test_string_takes_one_token() {
    sift::TokenStream stream({"hello world", "next"});

    auto result = sift::types::string()->resolve(stream);

    assert(result.success);
    assert(result.value == "hello world");
    assert(*stream.current() == "next");

    std::cout << "[PASS] test_string_takes_one_token\n";
}

void test_integer() {
    assert(run(sift::types::integer(), {"42"}).value == 42);
    assert(run(sift::types::integer(), {"-7"}).value == -7);
    assert(run(sift::types::integer(), {"+3"}).value == 3);

    auto bad = run(sift::types::integer(), {"4x"});
    assert(!bad.success);
    assert(bad.error == "invalid integer: 4x");

    auto huge = run(sift::types::integer(), {"99999999999999999999"});
    assert(!huge.success);
    assert(huge.error.find("out of range") != std::string::npos);

    std::cout << "[PASS] test_integer\n";
}

void test_float() {
    assert(run(sift::types::floating(), {"3.14"}).value.get<double>() == 3.14);
    assert(run(sift::types::floating(), {"-2.5"}).value.get<double>() == -2.5);
    assert(run(sift::types::floating(), {".5"}).value.get<double>() == 0.5);
    assert(run(sift::types::floating(), {"7"}).value.get<double>() == 7.0);

    double pos_inf = run(sift::types::floating(), {"inf"}).value.get<double>();
    double neg_inf = run(sift::types::floating(), {"-inf"}).value.get<double>();
    assert(std::isinf(pos_inf) && pos_inf > 0);
    assert(std::isinf(neg_inf) && neg_inf < 0);
    assert(std::isnan(run(sift::types::floating(), {"nan"}).value.get<double>()));

    auto bad = run(sift::types::floating(), {"nope"});
    assert(!bad.success);
    assert(bad.error == "invalid float: nope");
    assert(!run(sift::types::floating(), {"1e5"}).success);
    assert(!run(sift::types::floating(), {"-"}).success);
    assert(!run(sift::types::floating(), {"5."}).success);

    std::cout << "[PASS] test_float\n";
}

void test_float_ignores_host_locale() {
    bool switched = false;
    for (const char* name : {"de_DE.UTF-8", "de_DE.utf8", "fr_FR.UTF-8", "fr_FR.utf8"}) {
        try {
            std::locale::global(std::locale(name));
            switched = true;
            break;
        } catch (const std::runtime_error&) {
            continue; // not installed on this host
        }
    }

    auto parsed = run(sift::types::floating(), {"3.14"});
    std::locale::global(std::locale::classic());

    assert(parsed.success);
    assert(parsed.value.get<double>() == 3.14);

    std::cout << "[PASS] test_float_ignores_host_locale"
              << (switched ? "\n" : " (no comma-decimal locale installed)\n");
}

void test_boolean_literals_only() {
    assert(run(sift::types::boolean(), {"true"}).value == true);
    assert(run(sift::types::boolean(), {"false"}).value == false);

    auto bad = run(sift::types::boolean(), {"yes"});
    assert(!bad.success);
    assert(bad.error == "invalid boolean: yes");

    std::cout << "[PASS] test_boolean_literals_only\n";
}

void test_enum() {
    auto when = sift::types::oneOf({"always", "never", "auto"});

    assert(run(when, {"never"}).value == "never");

    auto bad = run(when, {"sometimes"});
    assert(!bad.success);
    assert(bad.error == "expected any of: always, never, auto. got: sometimes");

    std::cout << "[PASS] test_enum\n";
}

void test_variadic() {
    auto ints = sift::types::variadic(sift::types::integer());

    auto all = run(ints, {"1", "2", "3"});
    assert(all.success);
    assert((all.value == sift::Value{1, 2, 3}));

    auto none = run(ints, {});
    assert(none.success);
    assert(none.value.is_array() && none.value.empty());

    auto bad = run(ints, {"1", "x"});
    assert(!bad.success);
    assert(bad.error == "invalid integer: x");

    std::cout << "[PASS] test_variadic\n";
}

void test_end_of_stream() {
    auto result = run(sift::types::string(), {});
    assert(!result.success);
    assert(result.error == "insufficient arguments");
    assert(!run(sift::types::integer(), {}).success);

    std::cout << "[PASS] test_end_of_stream\n";
}

int main() {
    std::cout << "Running resolver tests...\n\n";

    test_string_takes_one_token();
    test_integer();
    test_float();
    test_float_ignores_host_locale();
    test_boolean_literals_only();
    test_enum();
    test_variadic();
    test_end_of_stream();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
