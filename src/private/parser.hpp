#pragma once

#include "bkregex/ast.hpp"

#include <string_view>

namespace bkregex {
// Throws PatternSyntaxError, never returns a partial tree
auto parse(std::string_view pattern) -> Node;
} // namespace bkregex
