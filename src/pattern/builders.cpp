#include "builders.hpp"

#include "../lexer/escape.hpp"

namespace pattern {

UnixWildcardBuilder::UnixWildcardBuilder(char escape, OperatorSet operators)
    : escape_(escape), operators_(std::move(operators)) {
    operators_.insert(UNIX_WILDCARD_OPERATORS.begin(), UNIX_WILDCARD_OPERATORS.end());
}

void UnixWildcardBuilder::literal(const std::string &text) {
    out_ += escape_string(text, escape_, operators_);
}

std::string to_simple_pattern(const Pattern &pattern) {
    SimplePatternBuilder builder;
    pattern.build(builder);
    return builder.str();
}

} // namespace pattern
