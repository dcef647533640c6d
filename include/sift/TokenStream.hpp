/**
 * TokenStream.hpp - Cursor over command tokens with snapshot/rollback
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sift {

class TokenStream {
public:
    explicit TokenStream(std::vector<std::string> tokens);

    std::optional<std::string> current() const;
    bool isEnd() const;
    void consume();

    // Splice a token in at the cursor; it becomes the current token
    void insert(const std::string& token);
    // Overwrite the current token (no-op at end)
    void replace(const std::string& token);

    // Save cursor and tokens. Every snapshot must be closed by exactly one
    // commit() or rollback(); closing with none open throws std::logic_error.
    void snapshot();
    void commit();
    void rollback();

    size_t position() const { return position_; }
    size_t openSnapshots() const { return saved_.size(); }
    const std::vector<std::string>& tokens() const { return tokens_; }
    std::vector<std::string> remaining() const;

private:
    struct State {
        size_t position;
        std::vector<std::string> tokens;
    };

    std::vector<std::string> tokens_;
    size_t position_ = 0;
    std::vector<State> saved_;
};

// Rolls the stream back on scope exit unless commit() was called
class ScopedSnapshot {
public:
    explicit ScopedSnapshot(TokenStream& stream);
    ~ScopedSnapshot();

    ScopedSnapshot(const ScopedSnapshot&) = delete;
    ScopedSnapshot& operator=(const ScopedSnapshot&) = delete;

    void commit();
    void rollback();

private:
    TokenStream& stream_;
    bool open_ = true;
};

} // namespace sift
