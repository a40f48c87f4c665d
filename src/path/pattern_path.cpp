#include "pattern_path.hpp"

#include "../utils/debug_context.hpp"

namespace path {

PatternPath PatternPath::parse(std::string_view text, char escape) {
    auto ctx = debug::push("pattern path", std::string(text));
    std::vector<pattern::Pattern> elements;
    Tokenizer tokenizer(text, escape, DEFAULT_PATTERN_OPERATORS);
    while (!tokenizer.done()) {
        if (tokenizer.current().is_operator('/')) {
            tokenizer.next();
            continue;
        }
        elements.push_back(pattern::parse_unix_wildcard(tokenizer));
    }
    return PatternPath(std::move(elements));
}

std::string PatternPath::to_string(char escape, const OperatorSet &operators) const {
    std::string result;
    for (size_t i = 0; i < size(); ++i) {
        if (i > 0) result += '/';
        result += element(i).to_string(escape, operators);
    }
    return result;
}

} // namespace path
