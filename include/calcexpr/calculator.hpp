#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "calcexpr/evaluator.hpp"
#include "calcexpr/expr.hpp"
#include "calcexpr/lexer.hpp"

namespace calcexpr {

/// An input field declared by a calculator definition.
struct CalculatorInput {
    std::string name;                          // binding key, as written in formulas
    std::string label;                         // human-readable description
    std::optional<double> default_value{};
};

/// Distinct variable names in order of first appearance, left to right.
std::vector<std::string> variables(const Expr& expr);

/// Variables of expr that no declared input provides, same order as variables().
std::vector<std::string> unknown_variables(const Expr& expr, const std::vector<CalculatorInput>& inputs);

/// Copy of expr where every declared variable carries its input's label.
/// Undeclared variables end up without a label.
Expr attach_labels(const Expr& expr, const std::vector<CalculatorInput>& inputs);

/// parse() followed by attach_labels(). std::nullopt for empty text.
std::optional<Expr> compile_formula(std::string_view text,
                                    const std::vector<CalculatorInput>& inputs,
                                    const LexOptions& opts = {});

/// Bindings from raw input-field text. Characters other than digits and '.'
/// are dropped before conversion; fields that are missing or hold no digits
/// fall back to default_value, or stay unbound without one.
Bindings collect_bindings(const std::vector<CalculatorInput>& inputs,
                          const std::map<std::string, std::string>& raw);

enum class ElementKind { Operator, Number, Input };

// One tap in the formula builder palette.
struct FormulaElement {
    ElementKind kind;
    std::string value;
};

/// Append a builder element to formula text, spaced the way the builder
/// writes formulas: "vw" + '*' + "ae" -> "vw * ae", '(' hugs what follows.
std::string append_element(std::string_view text, const FormulaElement& element);

} // namespace calcexpr
