#pragma once

#include <cstddef>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace debug {

// What is being parsed, e.g. {"matrix path", "abc;v=1/def"}.
struct ContextEntry {
    std::string kind;
    std::string input;
};

inline std::vector<ContextEntry>& context_stack() {
    thread_local std::vector<ContextEntry> stack;
    return stack;
}

// Keeps one entry on the context stack for the lifetime of the scope.
class Scope {
public:
    Scope(std::string kind, std::string input) {
        context_stack().push_back({std::move(kind), std::move(input)});
    }
    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;
    ~Scope() { context_stack().pop_back(); }
};

inline Scope push(std::string kind, std::string input) {
    return Scope(std::move(kind), std::move(input));
}

inline std::size_t depth() { return context_stack().size(); }

// Only the innermost entry is quoted; outer entries are named by kind.
inline std::string format_with_context(const std::string& message) {
    const auto& stack = context_stack();
    if (stack.empty()) {
        return message;
    }
    std::ostringstream oss;
    oss << "In ";
    for (std::size_t i = 0; i + 1 < stack.size(); ++i) {
        oss << stack[i].kind << " -> ";
    }
    oss << stack.back().kind << " '" << stack.back().input << "': " << message;
    return oss.str();
}

} // namespace debug
