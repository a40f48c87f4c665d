#pragma once

#include "../lexer/tokenizer.hpp"
#include "../pattern/pattern.hpp"

namespace path {

constexpr char DEFAULT_ESCAPE = '\\';

inline const OperatorSet DEFAULT_PATH_OPERATORS = {'/'};
inline const OperatorSet MATRIX_PATH_OPERATORS = {'/', ';', '='};
inline const OperatorSet DEFAULT_PATTERN_OPERATORS = with_operator(pattern::UNIX_WILDCARD_OPERATORS, '/');
inline const OperatorSet MATRIX_PATTERN_OPERATORS = {'/', ';', '=', '*', '?', '{', '}', ','};

} // namespace path
