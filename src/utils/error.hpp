#pragma once

#include <stdexcept>
#include <string>

#include "../span/span.hpp"
#include "debug_context.hpp"

class PathError : public std::runtime_error {
public:
    explicit PathError(const std::string& message,
                       span::Span span = span::Span::invalid())
        : std::runtime_error(message), span_(span) {}

    span::Span span() const { return span_; }

protected:
    span::Span span_ = span::Span::invalid();
};

// Malformed input: a stray '=' in a matrix segment, an unbalanced wildcard
// group, ... The parse that raised it is abandoned.
class SyntaxError : public PathError {
public:
    explicit SyntaxError(const std::string& message,
                         span::Span span = span::Span::invalid())
        : PathError(message, span) {}
};

namespace error_helper {

/**
 * @brief Throw a SyntaxError whose message carries the active debug context
 */
[[noreturn]] inline void report_syntax_error(const std::string& message,
                                             span::Span span = span::Span::invalid()) {
    throw SyntaxError(debug::format_with_context(message), span);
}

/**
 * @brief Report an operator that is not allowed where it appeared
 */
[[noreturn]] inline void report_unexpected_operator(char op, span::Span span) {
    report_syntax_error(std::string("unexpected '") + op + "'", span);
}

} // namespace error_helper
