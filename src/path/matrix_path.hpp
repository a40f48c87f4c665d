#pragma once

#include <string>
#include <string_view>

#include "constants.hpp"
#include "element.hpp"
#include "path.hpp"

namespace path {

/**
 * @brief A path of matrix elements, `abc;version=1/def;color=green;draft/xyz`
 *
 * `/`, `;` and `=` are reserved and must be escaped inside names, keys and
 * values. An attribute with no `=value` is a bare flag.
 */
class MatrixPath : public PathBase<MatrixPath, PathElementString> {
public:
    using PathBase::PathBase;

    // Throws SyntaxError on a value following `=` with no attribute key.
    static MatrixPath parse(std::string_view text, char escape = DEFAULT_ESCAPE);

    std::string to_string(char escape = DEFAULT_ESCAPE,
                          const OperatorSet &operators = MATRIX_PATH_OPERATORS) const;
};

// Matrix path whose names and attribute values are wildcard patterns, used to
// match a MatrixPath with matches().
class MatrixPathPattern : public PathBase<MatrixPathPattern, PathElementPattern> {
public:
    using PathBase::PathBase;

    static MatrixPathPattern parse(std::string_view text, char escape = DEFAULT_ESCAPE);

    std::string to_string(char escape = DEFAULT_ESCAPE,
                          const OperatorSet &operators = MATRIX_PATTERN_OPERATORS) const;
};

} // namespace path
