#pragma once
#include <functional>
#include <map>
#include <string>

#include "calcexpr/errors.hpp"
#include "calcexpr/expr.hpp"

namespace calcexpr {

using Bindings = std::map<std::string, double, std::less<>>;

/// Evaluate a tree against variable bindings.
/// Throws EvalError on an unbound variable or division by zero.
double evaluate(const Expr& expr, const Bindings& bindings);

} // namespace calcexpr
