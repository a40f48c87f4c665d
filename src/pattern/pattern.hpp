#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "../lexer/tokenizer.hpp"

namespace pattern {

inline const OperatorSet UNIX_WILDCARD_OPERATORS = {'*', '?', '{', '}', ','};

class Pattern;
class PatternBuilder;

struct Literal {
    std::string text;
    bool operator==(const Literal &other) const = default;
};

// `?`
struct AnyChar {
    bool operator==(const AnyChar &) const = default;
};

// `*`
struct AnySequence {
    bool operator==(const AnySequence &) const = default;
};

// `{a,b,...}`
struct Alternatives {
    std::vector<Pattern> options;
    bool operator==(const Alternatives &other) const;
};

using Element = std::variant<Literal, AnyChar, AnySequence, Alternatives>;

/**
 * @brief A compiled Unix wildcard expression
 *
 * Adjacent literal text is always held as one Literal element and runs of `*`
 * as one AnySequence, so structurally equal patterns compare equal no matter
 * how they were spelled.
 */
class Pattern {
public:
    Pattern() = default;
    explicit Pattern(std::vector<Element> elements);

    static Pattern literal(std::string text);

    /**
     * @brief Compile a standalone wildcard string
     * @throws SyntaxError on an unbalanced `{` or `}`
     */
    static Pattern parse(std::string_view text, char escape = '\\');

    /// True if the whole of `candidate` matches.
    bool test(std::string_view candidate) const;

    bool equals(const Pattern &other) const { return elements_ == other.elements_; }
    bool operator==(const Pattern &other) const { return equals(other); }

    bool is_literal() const;
    bool empty() const { return elements_.empty(); }
    const std::vector<Element> &elements() const { return elements_; }

    void build(PatternBuilder &builder) const;

    // Unix wildcard text that parses back to this pattern under the same
    // escape character and operators.
    std::string to_string(char escape = '\\', const OperatorSet &operators = UNIX_WILDCARD_OPERATORS) const;

    void append(Element element);

private:
    std::vector<Element> elements_;
};

std::ostream &operator<<(std::ostream &os, const Pattern &pattern);

/**
 * @brief Parse a wildcard expression from the tokenizer's current position
 *
 * Consumes literals and wildcard operators. Stops, without consuming it, at
 * the first operator that is not a wildcard operator (a path delimiter, for
 * example) and at the end of input. A `,` outside any `{}` group is literal.
 */
Pattern parse_unix_wildcard(Tokenizer &tokenizer);

} // namespace pattern
