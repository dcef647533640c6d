/**
 * ResultRecord.hpp - Parsed values keyed by argument, option and verb ids
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace sift {

// Dynamic value produced by resolvers and stored as defaults
using Value = nlohmann::json;

class ResultRecord {
public:
    ResultRecord();
    explicit ResultRecord(Value object);

    void set(const std::string& id, Value value);
    void set(const std::string& id, const ResultRecord& nested);

    // Throws std::out_of_range if id is not bound
    const Value& get(const std::string& id) const;

    template <typename T>
    T get(const std::string& id) const {
        return get(id).get<T>();
    }

    template <typename T>
    T getOr(const std::string& id, T fallback) const {
        return has(id) ? get(id).get<T>() : fallback;
    }

    bool has(const std::string& id) const;
    bool erase(const std::string& id);
    void clear();

    std::vector<std::string> keys() const;
    std::vector<std::pair<std::string, Value>> entries() const;
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    // Occurrence counters for options; a missing counter reads as zero
    long long increment(const std::string& id);
    long long count(const std::string& id) const;

    // Nested record bound under a sub-verb id
    bool hasRecord(const std::string& id) const;
    ResultRecord record(const std::string& id) const;

    // Copy every binding of other into this record, overwriting on collision
    void merge(const ResultRecord& other);

    const Value& json() const { return data_; }

private:
    Value data_;
};

} // namespace sift
