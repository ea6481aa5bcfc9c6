#include "calcexpr/parser.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace calcexpr {

namespace {

std::string describe(const Token& t) {
    switch (t.kind) {
        case TokKind::Ident:  return fmt::format("identifier '{}'", t.text);
        case TokKind::Number: return fmt::format("number '{}'", t.text);
        case TokKind::Plus:   return "'+'";
        case TokKind::Minus:  return "'-'";
        case TokKind::Star:   return "'*'";
        case TokKind::Slash:  return "'/'";
        case TokKind::LParen: return "'('";
        case TokKind::RParen: return "')'";
        case TokKind::End:    return "stray End token";
    }
    return "token";
}

// Two tiers, lowest first:
//   additive       := multiplicative (('+' | '-') multiplicative)*
//   multiplicative := primary (('*' | '/') primary)*
//   primary        := Number | Ident | '(' additive ')'
class Parser {
public:
    // Only the first n tokens are parsed; a final End token is left out by the caller.
    Parser(const std::vector<Token>& tokens, std::size_t n) : toks_(tokens), n_(n) {}

    Expr parse_all() {
        Expr e = parse_additive();
        if (!at_end()) {
            // a leftover ')' has no matching '('; anything else is a second operand
            if (peek().kind == TokKind::RParen) {
                throw ParseError(ParseErrorKind::UnexpectedToken,
                                 fmt::format("Unmatched ')' (token {})", i_ + 1));
            }
            throw ParseError(ParseErrorKind::TrailingTokens,
                             fmt::format("Unexpected {} after complete expression (token {})",
                                         describe(peek()), i_ + 1));
        }
        return e;
    }

private:
    bool at_end() const { return i_ >= n_; }

    const Token& peek() const { return toks_[i_]; }

    std::optional<Op> peek_op(TokKind a, TokKind b) const {
        if (at_end()) return std::nullopt;
        TokKind k = peek().kind;
        if (k != a && k != b) return std::nullopt;
        switch (k) {
            case TokKind::Plus:  return Op::Add;
            case TokKind::Minus: return Op::Sub;
            case TokKind::Star:  return Op::Mul;
            case TokKind::Slash: return Op::Div;
            default:             return std::nullopt;
        }
    }

    Expr fold(Op op, Expr lhs, Expr rhs) const {
        if (std::max(lhs.depth(), rhs.depth()) >= kMaxExprDepth) {
            throw ParseError(ParseErrorKind::TooDeep,
                             fmt::format("Formula nested deeper than {} levels (token {})", kMaxExprDepth, i_));
        }
        return Expr::binary(op, std::move(lhs), std::move(rhs));
    }

    Expr parse_additive() {
        Expr lhs = parse_multiplicative();
        while (auto op = peek_op(TokKind::Plus, TokKind::Minus)) {
            ++i_;
            lhs = fold(*op, std::move(lhs), parse_multiplicative());
        }
        return lhs;
    }

    Expr parse_multiplicative() {
        Expr lhs = parse_primary();
        while (auto op = peek_op(TokKind::Star, TokKind::Slash)) {
            ++i_;
            lhs = fold(*op, std::move(lhs), parse_primary());
        }
        return lhs;
    }

    Expr parse_primary() {
        if (at_end()) {
            throw ParseError(ParseErrorKind::UnexpectedEndOfInput,
                             "Unexpected end of input: expected a number, variable or '('");
        }

        const Token& t = toks_[i_];
        switch (t.kind) {
            case TokKind::Number:
                if (!is_valid_literal(t.text)) {
                    throw ParseError(ParseErrorKind::UnexpectedToken,
                                     fmt::format("Malformed {} (token {})", describe(t), i_ + 1));
                }
                ++i_;
                return Expr::literal(t.text);

            case TokKind::Ident:
                if (t.text.empty()) break;
                ++i_;
                return Expr::variable(t.text);

            case TokKind::LParen: {
                if (nesting_ >= kMaxExprDepth) {
                    throw ParseError(ParseErrorKind::TooDeep,
                                     fmt::format("Parentheses nested deeper than {} levels (token {})",
                                                 kMaxExprDepth, i_ + 1));
                }
                ++i_;
                ++nesting_;
                Expr inner = parse_additive();
                if (at_end()) {
                    throw ParseError(ParseErrorKind::UnexpectedEndOfInput,
                                     "Unexpected end of input: expected ')'");
                }
                if (peek().kind != TokKind::RParen) {
                    throw ParseError(ParseErrorKind::UnexpectedToken,
                                     fmt::format("Expected ')' but found {} (token {})",
                                                 describe(peek()), i_ + 1));
                }
                ++i_;
                --nesting_;
                return inner;
            }

            default:
                break;
        }

        throw ParseError(ParseErrorKind::UnexpectedToken,
                         fmt::format("Unexpected {} where a number, variable or '(' was expected (token {})",
                                     describe(t), i_ + 1));
    }

    const std::vector<Token>& toks_;
    std::size_t n_;
    std::size_t i_{0};
    std::size_t nesting_{0};
};

} // namespace

std::optional<Expr> parse(const std::vector<Token>& tokens) {
    // a single End is accepted as the terminator; an End anywhere else is a stray token
    std::size_t n = tokens.size();
    if (n > 0 && tokens.back().kind == TokKind::End) --n;
    if (n == 0) return std::nullopt;

    // a lone operand needs no descent
    if (n == 1) {
        const Token& t = tokens.front();
        if (t.kind == TokKind::Number && is_valid_literal(t.text)) return Expr::literal(t.text);
        if (t.kind == TokKind::Ident && !t.text.empty()) return Expr::variable(t.text);
    }

    return Parser(tokens, n).parse_all();
}

std::optional<Expr> parse(std::string_view text, const LexOptions& opts) {
    return parse(tokenize(text, opts));
}

} // namespace calcexpr
