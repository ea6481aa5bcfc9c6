#include <calcexpr/expr.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <fmt/format.h>

namespace calcexpr {

char op_symbol(Op op) noexcept {
    switch (op) {
        case Op::Add: return '+';
        case Op::Sub: return '-';
        case Op::Mul: return '*';
        case Op::Div: return '/';
    }
    return '?';
}

std::optional<Op> op_from_symbol(char c) noexcept {
    switch (c) {
        case '+': return Op::Add;
        case '-': return Op::Sub;
        case '*': return Op::Mul;
        case '/': return Op::Div;
        default:  return std::nullopt;
    }
}

int precedence(Op op) noexcept {
    switch (op) {
        case Op::Mul:
        case Op::Div: return 2;
        case Op::Add:
        case Op::Sub: return 1;
    }
    return 0;
}

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_valid_literal(std::string_view text) noexcept {
    std::size_t i = 0;
    while (i < text.size() && is_digit(text[i])) ++i;
    if (i == 0) return false;
    if (i == text.size()) return true;
    if (text[i] != '.') return false;
    std::size_t frac = ++i;
    while (i < text.size() && is_digit(text[i])) ++i;
    return i > frac && i == text.size();
}

Expr Expr::literal(std::string value) {
    if (!is_valid_literal(value)) {
        throw std::invalid_argument(fmt::format("Invalid numeric literal: '{}'", value));
    }
    return Expr(Literal{std::move(value)}, 1);
}

Expr Expr::variable(std::string name, std::optional<std::string> label) {
    if (name.empty()) throw std::invalid_argument("Variable name must not be empty");
    return Expr(Variable{std::move(name), std::move(label)}, 1);
}

Expr Expr::binary(Op op, Expr left, Expr right) {
    std::size_t depth = 1 + std::max(left.depth(), right.depth());
    if (depth > kMaxExprDepth) {
        throw std::invalid_argument(fmt::format("Formula nested deeper than {} levels", kMaxExprDepth));
    }
    return Expr(BinaryOp{op,
                         std::make_shared<const Expr>(std::move(left)),
                         std::make_shared<const Expr>(std::move(right))},
                depth);
}

template <class LeafEq>
static bool equal_with(const Expr& a, const Expr& b, LeafEq leaf_eq) {
    if (a.node().index() != b.node().index()) return false;

    if (a.is_literal()) return a.as_literal().value == b.as_literal().value;
    if (a.is_variable()) return leaf_eq(a.as_variable(), b.as_variable());

    const auto& x = a.as_binary();
    const auto& y = b.as_binary();
    if (x.op != y.op) return false;
    if (x.left != y.left && !equal_with(*x.left, *y.left, leaf_eq)) return false;
    return x.right == y.right || equal_with(*x.right, *y.right, leaf_eq);
}

bool operator==(const Expr& a, const Expr& b) {
    return equal_with(a, b, [](const Variable& x, const Variable& y) {
        return x.name == y.name && x.label == y.label;
    });
}

bool same_structure(const Expr& a, const Expr& b) {
    return equal_with(a, b, [](const Variable& x, const Variable& y) {
        return x.name == y.name;
    });
}

} // namespace calcexpr
