#pragma once

#include <string>

#include "pattern.hpp"

namespace pattern {

// Receives a pattern's elements in order from Pattern::build.
class PatternBuilder {
public:
    virtual ~PatternBuilder() = default;

    virtual void literal(const std::string &text) = 0;
    virtual void any_char() = 0;
    virtual void any_sequence() = 0;
    virtual void begin_alternatives() = 0;
    virtual void next_alternative() = 0;
    virtual void end_alternatives() = 0;
};

// Renders Unix wildcard syntax. Literal text has the wildcard operators and
// every character of `operators` escaped.
class UnixWildcardBuilder : public PatternBuilder {
public:
    UnixWildcardBuilder(char escape, OperatorSet operators);

    void literal(const std::string &text) override;
    void any_char() override { out_ += '?'; }
    void any_sequence() override { out_ += '*'; }
    void begin_alternatives() override { out_ += '{'; }
    void next_alternative() override { out_ += ','; }
    void end_alternatives() override { out_ += '}'; }

    const std::string &str() const { return out_; }

private:
    char escape_;
    OperatorSet operators_;
    std::string out_;
};

// Renders literal text verbatim and wildcards as their operator characters.
// The result is not guaranteed to parse back; it names a pattern, e.g. as
// the key of a matrix attribute.
class SimplePatternBuilder : public PatternBuilder {
public:
    void literal(const std::string &text) override { out_ += text; }
    void any_char() override { out_ += '?'; }
    void any_sequence() override { out_ += '*'; }
    void begin_alternatives() override { out_ += '{'; }
    void next_alternative() override { out_ += ','; }
    void end_alternatives() override { out_ += '}'; }

    const std::string &str() const { return out_; }

private:
    std::string out_;
};

std::string to_simple_pattern(const Pattern &pattern);

} // namespace pattern
