#include "element.hpp"

#include "../lexer/escape.hpp"
#include "constants.hpp"

namespace path {

bool PathElementPattern::test(const PathElementString &target) const {
    if (!name.test(target.name)) return false;
    for (const auto &[key, expected] : attr) {
        const auto *actual = target.attr.find(key);
        if (!actual) return false;
        if (!expected) {
            if (actual->has_value()) return false;
            continue;
        }
        if (!actual->has_value() || !expected->test(**actual)) return false;
    }
    return true;
}

std::string render_element(const PathElementString &element, char escape, const OperatorSet &operators) {
    std::string result = escape_string(element.name, escape, operators);
    for (const auto &[key, value] : element.attr) {
        result += ';' + escape_string(key, escape, operators);
        if (value) result += '=' + escape_string(*value, escape, operators);
    }
    return result;
}

std::string render_element(const PathElementPattern &element, char escape, const OperatorSet &operators) {
    std::string result = element.name.to_string(escape, operators);
    for (const auto &[key, value] : element.attr) {
        result += ';' + escape_string(key, escape, operators);
        if (value) result += '=' + value->to_string(escape, operators);
    }
    return result;
}

std::ostream &operator<<(std::ostream &os, const PathElementString &element) {
    return os << render_element(element, DEFAULT_ESCAPE, MATRIX_PATH_OPERATORS);
}

std::ostream &operator<<(std::ostream &os, const PathElementPattern &element) {
    return os << render_element(element, DEFAULT_ESCAPE, MATRIX_PATTERN_OPERATORS);
}

} // namespace path
