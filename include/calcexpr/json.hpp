#pragma once
#include <string>
#include <string_view>
#include "calcexpr/errors.hpp"
#include "calcexpr/expr.hpp"

namespace calcexpr {

/// Persisted shape of a formula tree:
///   {"type":"operator","value":"*","children":[<left>,<right>]}
///   {"type":"number","value":"60"}
///   {"type":"input","value":"vw","label":"Wheel speed"}
/// Output is compact, keys in the order above.
std::string to_json(const Expr& expr);

/// Rebuild a tree from its persisted form. Unknown keys (e.g. a UI "id")
/// are skipped. Throws FormatError on malformed JSON or an invalid tree.
Expr from_json(std::string_view json);

} // namespace calcexpr
