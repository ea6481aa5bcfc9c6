#pragma once
#include <string>
#include "calcexpr/expr.hpp"

namespace calcexpr {

/// Canonical text form: operands separated from operators by single spaces,
/// parentheses only where re-parsing would otherwise build a different tree.
std::string render(const Expr& expr);

} // namespace calcexpr
