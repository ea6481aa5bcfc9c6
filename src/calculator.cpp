#include "calcexpr/calculator.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include "calcexpr/parser.hpp"

namespace calcexpr {

static const CalculatorInput* find_input(const std::vector<CalculatorInput>& inputs, std::string_view name) {
    auto it = std::find_if(inputs.begin(), inputs.end(),
                           [&](const CalculatorInput& in) { return in.name == name; });
    return it == inputs.end() ? nullptr : &*it;
}

static void collect_variables(const Expr& e, std::vector<std::string>& out) {
    if (e.is_variable()) {
        const std::string& name = e.as_variable().name;
        if (std::find(out.begin(), out.end(), name) == out.end()) out.push_back(name);
    } else if (e.is_binary()) {
        collect_variables(*e.as_binary().left, out);
        collect_variables(*e.as_binary().right, out);
    }
}

std::vector<std::string> variables(const Expr& expr) {
    std::vector<std::string> out;
    collect_variables(expr, out);
    return out;
}

std::vector<std::string> unknown_variables(const Expr& expr, const std::vector<CalculatorInput>& inputs) {
    std::vector<std::string> out = variables(expr);
    out.erase(std::remove_if(out.begin(), out.end(),
                             [&](const std::string& n) { return find_input(inputs, n) != nullptr; }),
              out.end());
    return out;
}

Expr attach_labels(const Expr& expr, const std::vector<CalculatorInput>& inputs) {
    if (expr.is_literal()) return expr;

    if (expr.is_variable()) {
        const std::string& name = expr.as_variable().name;
        const CalculatorInput* in = find_input(inputs, name);
        if (!in) return Expr::variable(name);
        return Expr::variable(name, in->label);
    }

    const BinaryOp& bin = expr.as_binary();
    return Expr::binary(bin.op, attach_labels(*bin.left, inputs), attach_labels(*bin.right, inputs));
}

std::optional<Expr> compile_formula(std::string_view text,
                                    const std::vector<CalculatorInput>& inputs,
                                    const LexOptions& opts) {
    std::optional<Expr> tree = parse(text, opts);
    if (!tree) return std::nullopt;
    return attach_labels(*tree, inputs);
}

// "12.5.3" -> 12.5, "" -> nullopt
static std::optional<double> parse_field(std::string_view raw) {
    std::string cleaned;
    for (char c : raw) {
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') cleaned += c;
    }

    // longest prefix of the form digits[.digits] or .digits
    std::size_t i = 0;
    std::size_t digits = 0;
    while (i < cleaned.size() && std::isdigit(static_cast<unsigned char>(cleaned[i]))) { ++i; ++digits; }
    if (i < cleaned.size() && cleaned[i] == '.') {
        std::size_t j = i + 1;
        std::size_t frac = 0;
        while (j < cleaned.size() && std::isdigit(static_cast<unsigned char>(cleaned[j]))) { ++j; ++frac; }
        if (frac > 0) {
            i = j;
            digits += frac;
        }
    }
    if (digits == 0) return std::nullopt;

    double v = 0.0;
    std::from_chars(cleaned.data(), cleaned.data() + i, v);
    return v;
}

Bindings collect_bindings(const std::vector<CalculatorInput>& inputs,
                          const std::map<std::string, std::string>& raw) {
    Bindings out;
    for (const auto& in : inputs) {
        std::optional<double> v;
        auto it = raw.find(in.name);
        if (it != raw.end()) v = parse_field(it->second);
        if (!v) v = in.default_value;
        if (v) out[in.name] = *v;
    }
    return out;
}

static bool ends_with(std::string_view s, char c) {
    return !s.empty() && s.back() == c;
}

std::string append_element(std::string_view text, const FormulaElement& element) {
    std::string out(text);
    if (out.empty()) return element.value;

    if (element.kind == ElementKind::Operator) {
        const bool open = element.value == "(";
        const bool close = element.value == ")";
        if (!open && !ends_with(out, ' ') && !ends_with(out, '(')) out += ' ';
        out += element.value;
        if (!open && !close) out += ' ';
        return out;
    }

    if (!ends_with(out, ' ') && !ends_with(out, '(')) out += ' ';
    out += element.value;
    return out;
}

} // namespace calcexpr
