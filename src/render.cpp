#include "calcexpr/render.hpp"

namespace calcexpr {

namespace {

// A child needs parentheses when it binds looser than its parent, or when it
// is the right operand of the same tier (operators fold to the left).
bool needs_parens(const Expr& child, Op parent, bool is_right) {
    if (!child.is_binary()) return false;
    int pc = precedence(child.as_binary().op);
    int pp = precedence(parent);
    return pc < pp || (is_right && pc == pp);
}

void render_into(const Expr& e, std::string& out);

void render_operand(const Expr& child, Op parent, bool is_right, std::string& out) {
    if (needs_parens(child, parent, is_right)) {
        out += '(';
        render_into(child, out);
        out += ')';
    } else {
        render_into(child, out);
    }
}

void render_into(const Expr& e, std::string& out) {
    if (e.is_literal()) {
        out += e.as_literal().value;
    } else if (e.is_variable()) {
        out += e.as_variable().name;
    } else {
        const BinaryOp& bin = e.as_binary();
        render_operand(*bin.left, bin.op, false, out);
        out += ' ';
        out += op_symbol(bin.op);
        out += ' ';
        render_operand(*bin.right, bin.op, true, out);
    }
}

} // namespace

std::string render(const Expr& expr) {
    std::string out;
    render_into(expr, out);
    return out;
}

} // namespace calcexpr
