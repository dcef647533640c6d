/**
 * TokenStream.cpp - Cursor over command tokens with snapshot/rollback
 */

#include "sift/TokenStream.hpp"

#include <stdexcept>
#include <utility>

namespace sift {

TokenStream::TokenStream(std::vector<std::string> tokens)
    : tokens_(std::move(tokens)) {}

std::optional<std::string> TokenStream::current() const {
    if (isEnd()) {
        return std::nullopt;
    }
    return tokens_[position_];
}

bool TokenStream::isEnd() const {
    return position_ >= tokens_.size();
}

void TokenStream::consume() {
    if (!isEnd()) {
        ++position_;
    }
}

void TokenStream::insert(const std::string& token) {
    tokens_.insert(tokens_.begin() + static_cast<std::ptrdiff_t>(position_), token);
}

void TokenStream::replace(const std::string& token) {
    if (!isEnd()) {
        tokens_[position_] = token;
    }
}

void TokenStream::snapshot() {
    saved_.push_back(State{position_, tokens_});
}

void TokenStream::commit() {
    if (saved_.empty()) {
        throw std::logic_error("TokenStream::commit without an open snapshot");
    }
    saved_.pop_back();
}

void TokenStream::rollback() {
    if (saved_.empty()) {
        throw std::logic_error("TokenStream::rollback without an open snapshot");
    }
    position_ = saved_.back().position;
    tokens_ = std::move(saved_.back().tokens);
    saved_.pop_back();
}

std::vector<std::string> TokenStream::remaining() const {
    return std::vector<std::string>(tokens_.begin() + static_cast<std::ptrdiff_t>(position_),
                                    tokens_.end());
}

ScopedSnapshot::ScopedSnapshot(TokenStream& stream) : stream_(stream) {
    stream_.snapshot();
}

ScopedSnapshot::~ScopedSnapshot() {
    if (open_) {
        stream_.rollback();
    }
}

void ScopedSnapshot::commit() {
    if (open_) {
        open_ = false;
        stream_.commit();
    }
}

void ScopedSnapshot::rollback() {
    if (open_) {
        open_ = false;
        stream_.rollback();
    }
}

} // namespace sift
