#pragma once

#include <string>
#include <string_view>

#include "../pattern/pattern.hpp"
#include "constants.hpp"
#include "path.hpp"

namespace path {

// A path of wildcard patterns, `a*/b?/{c,d}`, for matching a StringPath.
class PatternPath : public PathBase<PatternPath, pattern::Pattern> {
public:
    using PathBase::PathBase;

    static PatternPath parse(std::string_view text, char escape = DEFAULT_ESCAPE);

    std::string to_string(char escape = DEFAULT_ESCAPE,
                          const OperatorSet &operators = DEFAULT_PATTERN_OPERATORS) const;

    bool compare_elements(const pattern::Pattern &a, const pattern::Pattern &b) const {
        return a.equals(b);
    }
};

} // namespace path
