#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace calcexpr {

enum class Op { Add, Sub, Mul, Div };

/// '+', '-', '*' or '/'.
char op_symbol(Op op) noexcept;
std::optional<Op> op_from_symbol(char c) noexcept;

/// 1 for + and -, 2 for * and /.
int precedence(Op op) noexcept;

/// Deepest tree (and deepest parenthesis nesting) any component accepts.
/// Every consumer walks trees recursively; this bounds their stack use.
inline constexpr std::size_t kMaxExprDepth = 1000;

/// True when text matches [0-9]+(\.[0-9]+)?
bool is_valid_literal(std::string_view text) noexcept;

class Expr;
using ExprPtr = std::shared_ptr<const Expr>;

struct Literal {
    std::string value; // decimal text, converted only at evaluation
};

struct Variable {
    std::string name;
    std::optional<std::string> label{}; // display only
};

struct BinaryOp {
    Op op;
    ExprPtr left;
    ExprPtr right;
};

/// Immutable formula tree node. Copies share children; nothing can be
/// modified after construction, so trees can be handed across threads freely.
class Expr {
public:
    using Node = std::variant<Literal, Variable, BinaryOp>;

    // Validating factories; throw std::invalid_argument on bad input,
    // including a binary node deeper than kMaxExprDepth.
    static Expr literal(std::string value);
    static Expr variable(std::string name, std::optional<std::string> label = std::nullopt);
    static Expr binary(Op op, Expr left, Expr right);

    const Node& node() const noexcept { return node_; }

    // 1 for a leaf, 1 + deeper child for an operator.
    std::size_t depth() const noexcept { return depth_; }

    template <class F>
    decltype(auto) visit(F&& f) const { return std::visit(std::forward<F>(f), node_); }

    bool is_literal() const noexcept { return std::holds_alternative<Literal>(node_); }
    bool is_variable() const noexcept { return std::holds_alternative<Variable>(node_); }
    bool is_binary() const noexcept { return std::holds_alternative<BinaryOp>(node_); }

    const Literal& as_literal() const { return std::get<Literal>(node_); }
    const Variable& as_variable() const { return std::get<Variable>(node_); }
    const BinaryOp& as_binary() const { return std::get<BinaryOp>(node_); }

private:
    Expr(Node n, std::size_t depth) : node_(std::move(n)), depth_(depth) {}

    Node node_;
    std::size_t depth_;
};

/// Full equality, variable labels included.
bool operator==(const Expr& a, const Expr& b);
inline bool operator!=(const Expr& a, const Expr& b) { return !(a == b); }

/// Equality of shape, operators, literal text and variable names.
/// Labels are ignored since text cannot carry them.
bool same_structure(const Expr& a, const Expr& b);

} // namespace calcexpr
