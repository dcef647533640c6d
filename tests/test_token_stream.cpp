/**
 * test_token_stream.cpp - Unit tests for TokenStream
 */

#include "sift/TokenStream.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

void test_cursor_moves_to_end() {
    sift::TokenStream stream({"a", "b"});

    assert(!stream.isEnd());
    assert(*stream.current() == "a");
    stream.consume();
    assert(*stream.current() == "b");
    stream.consume();
    assert(stream.isEnd());
    assert(!stream.current().has_value());

    stream.consume();
    assert(stream.position() == 2);

    std::cout << "[PASS] test_cursor_moves_to_end\n";
}

void test_insert_becomes_current() {
    sift::TokenStream stream({"--opt", "next"});

    stream.consume();
    stream.insert("value");
    assert(*stream.current() == "value");
    assert(stream.tokens().size() == 3);
    stream.consume();
    assert(*stream.current() == "next");

    std::cout << "[PASS] test_insert_becomes_current\n";
}

void test_insert_at_end() {
    sift::TokenStream stream({"-o"});

    stream.consume();
    assert(stream.isEnd());
    stream.insert("x");
    assert(!stream.isEnd());
    assert(*stream.current() == "x");

    std::cout << "[PASS] test_insert_at_end\n";
}

void test_replace_overwrites_current() {
    sift::TokenStream stream({"--level=5"});

    stream.replace("--level");
    assert(*stream.current() == "--level");
    assert(stream.tokens().size() == 1);

    stream.consume();
    stream.replace("ignored");
    assert(stream.tokens().size() == 1);

    std::cout << "[PASS] test_replace_overwrites_current\n";
}

void test_rollback_restores_tokens_and_cursor() {
    sift::TokenStream stream({"a", "b", "c"});
    stream.consume();

    stream.snapshot();
    stream.insert("x");
    stream.replace("y");
    stream.consume();
    stream.consume();
    stream.insert("z");
    stream.rollback();

    assert(stream.position() == 1);
    assert((stream.tokens() == std::vector<std::string>{"a", "b", "c"}));
    assert(stream.openSnapshots() == 0);

    std::cout << "[PASS] test_rollback_restores_tokens_and_cursor\n";
}

void test_commit_keeps_changes() {
    sift::TokenStream stream({"-abc"});

    stream.snapshot();
    stream.consume();
    stream.insert("c-value");
    stream.commit();

    assert(stream.position() == 1);
    assert(*stream.current() == "c-value");
    assert(stream.openSnapshots() == 0);

    std::cout << "[PASS] test_commit_keeps_changes\n";
}

void test_nested_snapshots() {
    sift::TokenStream stream({"1", "2", "3"});

    stream.snapshot();
    stream.consume();
    stream.snapshot();
    stream.consume();
    stream.commit();
    assert(stream.position() == 2);
    stream.rollback();
    assert(stream.position() == 0);

    std::cout << "[PASS] test_nested_snapshots\n";
}

void test_unbalanced_close_throws() {
    sift::TokenStream stream({"a"});

    bool threw = false;
    try {
        stream.commit();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        stream.rollback();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] test_unbalanced_close_throws\n";
}

void test_scoped_snapshot() {
    sift::TokenStream stream({"a", "b"});

    {
        sift::ScopedSnapshot attempt(stream);
        stream.consume();
        stream.insert("extra");
    }
    assert(stream.position() == 0);
    assert(stream.tokens().size() == 2);

    {
        sift::ScopedSnapshot attempt(stream);
        stream.consume();
        attempt.commit();
    }
    assert(stream.position() == 1);
    assert(stream.openSnapshots() == 0);
    assert((stream.remaining() == std::vector<std::string>{"b"}));

    std::cout << "[PASS] test_scoped_snapshot\n";
}

int main() {
    std::cout << "Running TokenStream tests...\n\n";

    test_cursor_moves_to_end();
    test_insert_becomes_current();
    test_insert_at_end();
    test_replace_overwrites_current();
    test_rollback_restores_tokens_and_cursor();
    test_commit_keeps_changes();
    test_nested_snapshots();
    test_unbalanced_close_throws();
    test_scoped_snapshot();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
