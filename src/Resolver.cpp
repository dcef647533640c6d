/**
 * Resolver.cpp - Built-in type resolvers
 */

#include "sift/Resolver.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <locale>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace sift {

Resolution Resolution::ok(Value value) {
    return Resolution{std::move(value), true, ""};
}

Resolution Resolution::fail(const std::string& error) {
    return Resolution{Value(), false, error};
}

namespace {

const std::string INSUFFICIENT = "insufficient arguments";

class StringResolver : public Resolver {
public:
    Resolution resolve(TokenStream& stream) const override {
        auto token = stream.current();
        if (!token) return Resolution::fail(INSUFFICIENT);
        stream.consume();
        return Resolution::ok(*token);
    }

    std::string name() const override { return "string"; }
};

class IntegerResolver : public Resolver {
public:
    Resolution resolve(TokenStream& stream) const override {
        static const std::regex pattern("^[+-]?[0-9]+$");

        auto token = stream.current();
        if (!token) return Resolution::fail(INSUFFICIENT);
        stream.consume();

        if (!std::regex_match(*token, pattern)) {
            return Resolution::fail("invalid integer: " + *token);
        }
        try {
            return Resolution::ok(std::stoll(*token));
        } catch (const std::out_of_range&) {
            return Resolution::fail("integer out of range: " + *token);
        }
    }

    std::string name() const override { return "int"; }
};

class FloatResolver : public Resolver {
public:
    Resolution resolve(TokenStream& stream) const override {
        static const std::regex pattern("^[0-9]*(\\.[0-9]+)?$");

        auto token = stream.current();
        if (!token) return Resolution::fail(INSUFFICIENT);
        stream.consume();

        std::string text = *token;
        double sign = 1.0;
        if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
            sign = text[0] == '-' ? -1.0 : 1.0;
            text.erase(0, 1);
        }

        if (text == "inf") return Resolution::ok(sign * std::numeric_limits<double>::infinity());
        if (text == "nan") return Resolution::ok(std::numeric_limits<double>::quiet_NaN());

        // "", "-" and "." all pass the pattern's optional parts but carry no digits
        if (text.empty() || !std::regex_match(text, pattern)) {
            return Resolution::fail("invalid float: " + *token);
        }
        // The decimal separator is always '.', whatever the host locale says
        std::istringstream in(text);
        in.imbue(std::locale::classic());
        double value = 0.0;
        if (!(in >> value)) {
            return Resolution::fail("invalid float: " + *token);
        }
        return Resolution::ok(sign * value);
    }

    std::string name() const override { return "float"; }
};

class BooleanResolver : public Resolver {
public:
    Resolution resolve(TokenStream& stream) const override {
        auto token = stream.current();
        if (!token) return Resolution::fail(INSUFFICIENT);
        stream.consume();

        if (*token == "true") return Resolution::ok(true);
        if (*token == "false") return Resolution::ok(false);
        return Resolution::fail("invalid boolean: " + *token);
    }

    std::string name() const override { return "bool"; }
};

class EnumResolver : public Resolver {
public:
    explicit EnumResolver(std::vector<std::string> choices) : choices_(std::move(choices)) {}

    Resolution resolve(TokenStream& stream) const override {
        auto token = stream.current();
        if (!token) return Resolution::fail(INSUFFICIENT);
        stream.consume();

        if (std::find(choices_.begin(), choices_.end(), *token) != choices_.end()) {
            return Resolution::ok(*token);
        }
        return Resolution::fail("expected any of: " + joined() + ". got: " + *token);
    }

    std::string name() const override { return "enum(" + joined() + ")"; }

private:
    std::vector<std::string> choices_;

    std::string joined() const {
        std::string out;
        for (const auto& choice : choices_) {
            if (!out.empty()) out += ", ";
            out += choice;
        }
        return out;
    }
};

class VariadicResolver : public Resolver {
public:
    explicit VariadicResolver(ResolverPtr inner) : inner_(std::move(inner)) {}

    Resolution resolve(TokenStream& stream) const override {
        Value values = Value::array();
        while (!stream.isEnd()) {
            size_t before = stream.position();
            Resolution item = inner_->resolve(stream);
            if (!item.success) {
                return item;
            }
            if (stream.position() == before) {
                return Resolution::fail(inner_->name() + " resolver consumed no token");
            }
            values.push_back(std::move(item.value));
        }
        return Resolution::ok(std::move(values));
    }

    std::string name() const override { return "variadic(" + inner_->name() + ")"; }

private:
    ResolverPtr inner_;
};

} // anonymous namespace

namespace types {

ResolverPtr string() {
    static const ResolverPtr instance = std::make_shared<StringResolver>();
    return instance;
}

ResolverPtr integer() {
    static const ResolverPtr instance = std::make_shared<IntegerResolver>();
    return instance;
}

ResolverPtr floating() {
    static const ResolverPtr instance = std::make_shared<FloatResolver>();
    return instance;
}

ResolverPtr boolean() {
    static const ResolverPtr instance = std::make_shared<BooleanResolver>();
    return instance;
}

ResolverPtr oneOf(std::vector<std::string> choices) {
    return std::make_shared<EnumResolver>(std::move(choices));
}

ResolverPtr variadic(ResolverPtr inner) {
    if (!inner) {
        throw std::invalid_argument("variadic resolver needs an inner resolver");
    }
    return std::make_shared<VariadicResolver>(std::move(inner));
}

} // namespace types

} // namespace sift
