/**
 * ResultRecord.cpp - Parsed values keyed by argument, option and verb ids
 */

#include "sift/ResultRecord.hpp"

#include <stdexcept>

namespace sift {

ResultRecord::ResultRecord() : data_(Value::object()) {}

ResultRecord::ResultRecord(Value object) : data_(std::move(object)) {
    if (!data_.is_object()) {
        throw std::invalid_argument("ResultRecord requires a JSON object");
    }
}

void ResultRecord::set(const std::string& id, Value value) {
    data_[id] = std::move(value);
}

void ResultRecord::set(const std::string& id, const ResultRecord& nested) {
    data_[id] = nested.data_;
}

const Value& ResultRecord::get(const std::string& id) const {
    auto it = data_.find(id);
    if (it == data_.end()) {
        throw std::out_of_range("no value bound for '" + id + "'");
    }
    return *it;
}

bool ResultRecord::has(const std::string& id) const {
    return data_.contains(id);
}

bool ResultRecord::erase(const std::string& id) {
    return data_.erase(id) > 0;
}

void ResultRecord::clear() {
    data_ = Value::object();
}

std::vector<std::string> ResultRecord::keys() const {
    std::vector<std::string> out;
    out.reserve(data_.size());
    for (auto it = data_.begin(); it != data_.end(); ++it) {
        out.push_back(it.key());
    }
    return out;
}

std::vector<std::pair<std::string, Value>> ResultRecord::entries() const {
    std::vector<std::pair<std::string, Value>> out;
    out.reserve(data_.size());
    for (auto it = data_.begin(); it != data_.end(); ++it) {
        out.emplace_back(it.key(), it.value());
    }
    return out;
}

long long ResultRecord::increment(const std::string& id) {
    long long next = count(id) + 1;
    data_[id] = next;
    return next;
}

long long ResultRecord::count(const std::string& id) const {
    auto it = data_.find(id);
    if (it == data_.end() || !it->is_number_integer()) {
        return 0;
    }
    return it->get<long long>();
}

bool ResultRecord::hasRecord(const std::string& id) const {
    auto it = data_.find(id);
    return it != data_.end() && it->is_object();
}

ResultRecord ResultRecord::record(const std::string& id) const {
    const Value& value = get(id);
    if (!value.is_object()) {
        throw std::out_of_range("'" + id + "' is not a nested record");
    }
    return ResultRecord(value);
}

void ResultRecord::merge(const ResultRecord& other) {
    for (auto it = other.data_.begin(); it != other.data_.end(); ++it) {
        data_[it.key()] = it.value();
    }
}

} // namespace sift
