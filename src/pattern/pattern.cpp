#include "pattern.hpp"

#include "builders.hpp"
#include "../utils/error.hpp"

namespace pattern {

namespace {

constexpr int kMaxGroupDepth = 256;

// Matches a flat element list against text, memoizing on (element index,
// text offset) so runs of '*' stay polynomial. A group is expanded into one
// candidate list per option, each matched by its own Matcher.
class Matcher {
public:
    Matcher(const std::vector<Element> &elements, std::string_view text)
        : elements_(elements), text_(text),
          memo_((elements.size() + 1) * (text.size() + 1), Unknown) {}

    bool match(size_t index, size_t offset) {
        if (index == elements_.size()) {
            return offset == text_.size();
        }
        auto &slot = memo_[index * (text_.size() + 1) + offset];
        if (slot == Unknown) {
            slot = match_element(index, offset) ? Matched : Failed;
        }
        return slot == Matched;
    }

private:
    enum State : unsigned char { Unknown, Matched, Failed };

    bool match_element(size_t index, size_t offset) {
        std::string_view rest = text_.substr(offset);
        const auto &element = elements_[index];
        if (const auto *lit = std::get_if<Literal>(&element)) {
            if (rest.substr(0, lit->text.size()) != lit->text) return false;
            return match(index + 1, offset + lit->text.size());
        }
        if (std::holds_alternative<AnyChar>(element)) {
            return !rest.empty() && match(index + 1, offset + 1);
        }
        if (std::holds_alternative<AnySequence>(element)) {
            for (size_t at = offset; at <= text_.size(); ++at) {
                if (match(index + 1, at)) return true;
            }
            return false;
        }
        const auto &group = std::get<Alternatives>(element);
        for (const auto &option : group.options) {
            std::vector<Element> candidate = option.elements();
            candidate.insert(candidate.end(), elements_.begin() + index + 1, elements_.end());
            if (Matcher(candidate, rest).match(0, 0)) {
                return true;
            }
        }
        return false;
    }

    const std::vector<Element> &elements_;
    std::string_view text_;
    std::vector<State> memo_;
};

bool is_wildcard_operator(const Token &token) {
    return token.type == TOKEN_OPERATOR && UNIX_WILDCARD_OPERATORS.count(token.value[0]) > 0;
}

Pattern parse_sequence(Tokenizer &tokenizer, int depth);

Alternatives parse_group(Tokenizer &tokenizer, int depth) {
    span::Span open = tokenizer.current().span;
    if (depth >= kMaxGroupDepth) {
        error_helper::report_syntax_error("wildcard groups nested too deeply", open);
    }
    tokenizer.next(); // '{'
    Alternatives group;
    while (true) {
        group.options.push_back(parse_sequence(tokenizer, depth + 1));
        if (tokenizer.done() || !is_wildcard_operator(tokenizer.current())) {
            error_helper::report_syntax_error("unterminated '{'", open);
        }
        bool closing = tokenizer.current().is_operator('}');
        tokenizer.next(); // ',' or '}'
        if (closing) return group;
    }
}

Pattern parse_sequence(Tokenizer &tokenizer, int depth) {
    Pattern result;
    while (!tokenizer.done()) {
        const Token &token = tokenizer.current();
        if (token.type == TOKEN_LITERAL) {
            result.append(Literal{token.value});
            tokenizer.next();
            continue;
        }
        if (!is_wildcard_operator(token)) break;

        switch (token.value[0]) {
        case '*':
            result.append(AnySequence{});
            tokenizer.next();
            break;
        case '?':
            result.append(AnyChar{});
            tokenizer.next();
            break;
        case '{':
            result.append(parse_group(tokenizer, depth));
            break;
        case ',':
            if (depth > 0) return result;
            result.append(Literal{","});
            tokenizer.next();
            break;
        case '}':
            if (depth > 0) return result;
            error_helper::report_unexpected_operator('}', token.span);
        }
    }
    return result;
}

} // namespace

bool Alternatives::operator==(const Alternatives &other) const {
    return options == other.options;
}

Pattern::Pattern(std::vector<Element> elements) {
    for (auto &element : elements) {
        append(std::move(element));
    }
}

Pattern Pattern::literal(std::string text) {
    Pattern result;
    result.append(Literal{std::move(text)});
    return result;
}

Pattern Pattern::parse(std::string_view text, char escape) {
    auto ctx = debug::push("pattern", std::string(text));
    Tokenizer tokenizer(text, escape, UNIX_WILDCARD_OPERATORS);
    return parse_unix_wildcard(tokenizer);
}

void Pattern::append(Element element) {
    if (auto *lit = std::get_if<Literal>(&element)) {
        if (lit->text.empty()) return;
        if (!elements_.empty()) {
            if (auto *prev = std::get_if<Literal>(&elements_.back())) {
                prev->text += lit->text;
                return;
            }
        }
    } else if (std::holds_alternative<AnySequence>(element)) {
        if (!elements_.empty() && std::holds_alternative<AnySequence>(elements_.back())) return;
    }
    elements_.push_back(std::move(element));
}

bool Pattern::test(std::string_view candidate) const {
    return Matcher(elements_, candidate).match(0, 0);
}

bool Pattern::is_literal() const {
    return elements_.empty() || (elements_.size() == 1 && std::holds_alternative<Literal>(elements_[0]));
}

void Pattern::build(PatternBuilder &builder) const {
    for (const auto &element : elements_) {
        if (const auto *lit = std::get_if<Literal>(&element)) {
            builder.literal(lit->text);
        } else if (std::holds_alternative<AnyChar>(element)) {
            builder.any_char();
        } else if (std::holds_alternative<AnySequence>(element)) {
            builder.any_sequence();
        } else {
            const auto &group = std::get<Alternatives>(element);
            builder.begin_alternatives();
            for (size_t i = 0; i < group.options.size(); ++i) {
                if (i > 0) builder.next_alternative();
                group.options[i].build(builder);
            }
            builder.end_alternatives();
        }
    }
}

std::string Pattern::to_string(char escape, const OperatorSet &operators) const {
    UnixWildcardBuilder builder(escape, operators);
    build(builder);
    return builder.str();
}

std::ostream &operator<<(std::ostream &os, const Pattern &pattern) {
    return os << pattern.to_string();
}

Pattern parse_unix_wildcard(Tokenizer &tokenizer) {
    return parse_sequence(tokenizer, 0);
}

} // namespace pattern
