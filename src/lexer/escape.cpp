#include "escape.hpp"

std::string escape_string(std::string_view value, char escape, const OperatorSet &operators) {
    std::string result;
    result.reserve(value.size());
    for (const auto &token : tokenize(value, std::nullopt, with_operator(operators, escape))) {
        if (token.type == TOKEN_OPERATOR) {
            result += escape;
        }
        result += token.value;
    }
    return result;
}
