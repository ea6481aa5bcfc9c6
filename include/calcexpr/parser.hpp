#pragma once
#include <optional>
#include <string_view>
#include <vector>
#include "calcexpr/expr.hpp"
#include "calcexpr/lexer.hpp"
#include "calcexpr/token.hpp"

namespace calcexpr {

/// Parse a token sequence into a tree.
/// Returns std::nullopt for an empty sequence (no formula entered);
/// throws ParseError for anything that is not exactly one expression.
std::optional<Expr> parse(const std::vector<Token>& tokens);

// tokenize + parse
std::optional<Expr> parse(std::string_view text, const LexOptions& opts = {});

} // namespace calcexpr
