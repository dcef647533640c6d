/**
 * test_tokenizer.cpp - Unit tests for tokenize
 */

#include "sift/Tokenizer.hpp"

#include <cassert>
#include <iostream>

using Tokens = std::vector<std::string>;

void test_split_on_whitespace() {
    auto tokens = sift::tokenize("ls   -la\t/home ");

    assert((tokens == Tokens{"ls", "-la", "/home"}));

    std::cout << "[PASS] test_split_on_whitespace\n";
}

void test_quotes_group_words() {
    auto tokens = sift::tokenize("find . -name '*.cpp' -exec \"grep -l\" TODO");

    assert((tokens == Tokens{"find", ".", "-name", "*.cpp", "-exec", "grep -l", "TODO"}));

    std::cout << "[PASS] test_quotes_group_words\n";
}

void test_quotes_inside_token() {
    assert((sift::tokenize("--msg='hello world'") == Tokens{"--msg=hello world"}));
    assert((sift::tokenize("say \"it's\"") == Tokens{"say", "it's"}));

    std::cout << "[PASS] test_quotes_inside_token\n";
}

void test_escapes() {
    assert((sift::tokenize("a\\ b c") == Tokens{"a b", "c"}));
    assert((sift::tokenize("\\\"quoted\\\"") == Tokens{"\"quoted\""}));
    assert((sift::tokenize("trailing\\") == Tokens{"trailing"}));

    std::cout << "[PASS] test_escapes\n";
}

void test_empty_quotes_make_a_token() {
    assert((sift::tokenize("set name \"\"") == Tokens{"set", "name", ""}));
    assert(sift::tokenize("   ").empty());
    assert(sift::tokenize("").empty());

    std::cout << "[PASS] test_empty_quotes_make_a_token\n";
}

void test_unterminated_quote() {
    assert((sift::tokenize("echo 'open ended") == Tokens{"echo", "open ended"}));

    std::cout << "[PASS] test_unterminated_quote\n";
}

int main() {
    std::cout << "Running tokenizer tests...\n\n";

    test_split_on_whitespace();
    test_quotes_group_words();
    test_quotes_inside_token();
    test_escapes();
    test_empty_quotes_make_a_token();
    test_unterminated_quote();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
