#include "matrix_path.hpp"

#include "../pattern/builders.hpp"
#include "../utils/debug_context.hpp"
#include "matrix_builder.hpp"

namespace path {

namespace {

template <typename PathT>
std::string join_elements(const PathT &elements, char escape, const OperatorSet &operators) {
    std::string result;
    for (size_t i = 0; i < elements.size(); ++i) {
        if (i > 0) result += '/';
        result += render_element(elements.element(i), escape, operators);
    }
    return result;
}

} // namespace

MatrixPath MatrixPath::parse(std::string_view text, char escape) {
    auto ctx = debug::push("matrix path", std::string(text));
    MatrixPathBuilder<std::string, PathElementString> builder(
        [](const std::string &value) { return value; });
    for (Tokenizer tokenizer(text, escape, MATRIX_PATH_OPERATORS); !tokenizer.done(); tokenizer.next()) {
        const Token &token = tokenizer.current();
        if (token.type == TOKEN_LITERAL) {
            builder.add_value(token.value);
        } else {
            builder.add_operator(token.value[0], token.span);
        }
    }
    return MatrixPath(builder.build());
}

std::string MatrixPath::to_string(char escape, const OperatorSet &operators) const {
    return join_elements(*this, escape, operators);
}

MatrixPathPattern MatrixPathPattern::parse(std::string_view text, char escape) {
    auto ctx = debug::push("matrix path pattern", std::string(text));
    MatrixPathBuilder<pattern::Pattern, PathElementPattern> builder(pattern::to_simple_pattern);
    Tokenizer tokenizer(text, escape, MATRIX_PATTERN_OPERATORS);
    while (!tokenizer.done()) {
        const Token &token = tokenizer.current();
        if (token.type == TOKEN_OPERATOR && MATRIX_PATH_OPERATORS.count(token.value[0])) {
            builder.add_operator(token.value[0], token.span);
            tokenizer.next();
        } else {
            builder.add_value(pattern::parse_unix_wildcard(tokenizer));
        }
    }
    return MatrixPathPattern(builder.build());
}

std::string MatrixPathPattern::to_string(char escape, const OperatorSet &operators) const {
    return join_elements(*this, escape, operators);
}

} // namespace path
