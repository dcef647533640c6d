/**
 * Resolver.hpp - Token-to-value type resolvers
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sift/ResultRecord.hpp"
#include "sift/TokenStream.hpp"

namespace sift {

struct Resolution {
    Value value;
    bool success;
    std::string error;

    static Resolution ok(Value value);
    static Resolution fail(const std::string& error);
};

// Converts the token(s) at the cursor into a value. On failure the stream
// position is unspecified; callers that may retry must snapshot first.
class Resolver {
public:
    virtual ~Resolver() = default;

    virtual Resolution resolve(TokenStream& stream) const = 0;
    virtual std::string name() const = 0;
};

using ResolverPtr = std::shared_ptr<const Resolver>;

namespace types {

ResolverPtr string();
ResolverPtr integer();
ResolverPtr floating();
ResolverPtr boolean();
ResolverPtr oneOf(std::vector<std::string> choices);
ResolverPtr variadic(ResolverPtr inner);

} // namespace types

} // namespace sift
