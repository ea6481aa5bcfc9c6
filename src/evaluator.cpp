#include "calcexpr/evaluator.hpp"

#include <charconv>

#include <fmt/format.h>

namespace calcexpr {

static double apply_binary(Op op, double x, double y) {
    switch (op) {
        case Op::Add: return x + y;
        case Op::Sub: return x - y;
        case Op::Mul: return x * y;
        case Op::Div:
            if (y == 0.0) throw EvalError(EvalErrorKind::DivisionByZero, "Division by zero");
            return x / y;
    }
    return 0.0;
}

namespace {

struct Evaluator {
    const Bindings& env;

    double operator()(const Literal& lit) const {
        // literal text is validated at construction, so conversion cannot fail;
        // from_chars ignores the locale's decimal separator
        double v = 0.0;
        std::from_chars(lit.value.data(), lit.value.data() + lit.value.size(), v);
        return v;
    }

    double operator()(const Variable& var) const {
        auto it = env.find(var.name);
        if (it == env.end()) {
            throw EvalError(EvalErrorKind::UnboundVariable,
                            fmt::format("Unknown variable: {}", var.name), var.name);
        }
        return it->second;
    }

    double operator()(const BinaryOp& bin) const {
        double x = bin.left->visit(*this);
        double y = bin.right->visit(*this);
        return apply_binary(bin.op, x, y);
    }
};

} // namespace

double evaluate(const Expr& expr, const Bindings& bindings) {
    return expr.visit(Evaluator{bindings});
}

} // namespace calcexpr
