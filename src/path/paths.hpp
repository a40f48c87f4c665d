#pragma once

#include "constants.hpp"
#include "element.hpp"
#include "matrix_path.hpp"
#include "path.hpp"
#include "pattern_path.hpp"
