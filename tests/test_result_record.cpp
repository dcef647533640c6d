/**
 * test_result_record.cpp - Unit tests for ResultRecord
 */

#include "sift/ResultRecord.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <stdexcept>

void test_set_get_has_erase() {
    sift::ResultRecord record;

    record.set("name", "origin");
    record.set("depth", 3);
    assert(record.has("name"));
    assert(record.get<std::string>("name") == "origin");
    assert(record.get<int>("depth") == 3);
    assert(record.getOr<int>("missing", 9) == 9);

    assert(record.erase("name"));
    assert(!record.erase("name"));
    assert(!record.has("name"));

    bool threw = false;
    try {
        record.get("name");
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    record.clear();
    assert(record.empty());

    std::cout << "[PASS] test_set_get_has_erase\n";
}

void test_keys_and_entries() {
    sift::ResultRecord record;
    record.set("b", 2);
    record.set("a", 1);

    auto keys = record.keys();
    std::sort(keys.begin(), keys.end());
    assert((keys == std::vector<std::string>{"a", "b"}));

    auto entries = record.entries();
    assert(entries.size() == 2);
    for (const auto& entry : entries) {
        assert(entry.second == (entry.first == "a" ? 1 : 2));
    }

    std::cout << "[PASS] test_keys_and_entries\n";
}

void test_counters() {
    sift::ResultRecord record;

    assert(record.count("verbose") == 0);
    assert(record.increment("verbose") == 1);
    assert(record.increment("verbose") == 2);
    assert(record.count("verbose") == 2);

    std::cout << "[PASS] test_counters\n";
}

void test_nested_records() {
    sift::ResultRecord add;
    add.set("url", "https://example.org");
    add.set("add", true);

    sift::ResultRecord remote;
    remote.set("add", add);

    assert(remote.hasRecord("add"));
    assert(remote.record("add").get<std::string>("url") == "https://example.org");
    assert(remote.json()["add"]["add"] == true);

    remote.set("flag", 1);
    assert(!remote.hasRecord("flag"));

    std::cout << "[PASS] test_nested_records\n";
}

void test_merge_last_write_wins() {
    sift::ResultRecord base;
    base.set("keep", "base");
    base.set("shared", "base");

    sift::ResultRecord other;
    other.set("shared", "other");
    other.set("extra", true);

    base.merge(other);
    assert(base.get<std::string>("keep") == "base");
    assert(base.get<std::string>("shared") == "other");
    assert(base.get<bool>("extra"));
    assert(base.size() == 3);

    std::cout << "[PASS] test_merge_last_write_wins\n";
}

int main() {
    std::cout << "Running ResultRecord tests...\n\n";

    test_set_get_has_erase();
    test_keys_and_entries();
    test_counters();
    test_nested_records();
    test_merge_last_write_wins();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
