// pilc/ir/display.hpp - Textual rendering of the analyzed program
//
// Renders expressions, identities and whole programs back to PIL-like
// syntax. Binary operations are always parenthesized.
//
#pragma once

#include <string>

#include "pilc/ir/analyzed.hpp"

namespace pilc
{

[[nodiscard]] std::string format_expression(const Expression * expr);

[[nodiscard]] std::string format_selected_expressions(const SelectedExpressions & sel);

[[nodiscard]] std::string format_identity(const Identity & identity);

/// Constants first (by name), then every statement in source order
[[nodiscard]] std::string format_analyzed(const Analyzed & analyzed);

}  // namespace pilc
