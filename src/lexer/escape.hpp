#pragma once

#include <string>
#include <string_view>

#include "tokenizer.hpp"

// Renders `value` so that tokenizing the result with `escape` and `operators`
// yields `value` back as a single literal. Every operator character, and the
// escape character itself, is prefixed with `escape`.
std::string escape_string(std::string_view value, char escape, const OperatorSet &operators);
