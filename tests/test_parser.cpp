#include <gtest/gtest.h>
#include <calcexpr/evaluator.hpp>
#include <calcexpr/parser.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

using calcexpr::Expr;
using calcexpr::Op;
using calcexpr::ParseErrorKind;

static Expr parse_ok(const std::string& text) {
    auto e = calcexpr::parse(text);
    if (!e) throw std::runtime_error("no expression for: " + text);
    return *e;
}

static ParseErrorKind parse_fail(const std::string& text) {
    try {
        calcexpr::parse(text);
    } catch (const calcexpr::ParseError& e) {
        return e.kind();
    }
    throw std::runtime_error("expected ParseError for: " + text);
}

static Expr v(const char* name) { return Expr::variable(name); }
static Expr n(const char* text) { return Expr::literal(text); }

TEST(Parser, SingleNumberIsBareLiteral) {
    Expr e = parse_ok("42");
    ASSERT_TRUE(e.is_literal());
    EXPECT_EQ(e.as_literal().value, "42");
}

TEST(Parser, SingleIdentifierIsBareVariable) {
    Expr e = parse_ok("vw");
    ASSERT_TRUE(e.is_variable());
    EXPECT_EQ(e.as_variable().name, "vw");
    EXPECT_FALSE(e.as_variable().label.has_value());
}

TEST(Parser, MultiplicationBindsTighter) {
    Expr expected = Expr::binary(Op::Add, v("a"), Expr::binary(Op::Mul, v("b"), v("c")));
    EXPECT_EQ(parse_ok("a + b * c"), expected);
}

TEST(Parser, SubtractionIsLeftAssociative) {
    Expr expected = Expr::binary(Op::Sub, Expr::binary(Op::Sub, v("a"), v("b")), v("c"));
    EXPECT_EQ(parse_ok("a - b - c"), expected);
}

TEST(Parser, DivisionIsLeftAssociative) {
    Expr expected = Expr::binary(Op::Div, Expr::binary(Op::Div, v("a"), v("b")), v("c"));
    EXPECT_EQ(parse_ok("a / b / c"), expected);
}

TEST(Parser, ParenthesesOverridePrecedence) {
    Expr expected = Expr::binary(Op::Mul, Expr::binary(Op::Add, v("a"), v("b")), v("c"));
    EXPECT_EQ(parse_ok("(a + b) * c"), expected);
}

TEST(Parser, ParenthesesOnRightOperand) {
    Expr expected = Expr::binary(Op::Sub, v("a"), Expr::binary(Op::Sub, v("b"), v("c")));
    EXPECT_EQ(parse_ok("a - (b - c)"), expected);
}

TEST(Parser, RedundantParenthesesVanish) {
    EXPECT_EQ(parse_ok("((vw))"), v("vw"));
    EXPECT_EQ(parse_ok("(a * b) + c"), parse_ok("a * b + c"));
}

TEST(Parser, GrindingFormula) {
    Expr expected = Expr::binary(Op::Div, Expr::binary(Op::Mul, v("vw"), v("ae")), n("60"));
    EXPECT_EQ(parse_ok("vw * ae / 60"), expected);
}

TEST(Parser, PrecedenceShowsInEvaluation) {
    calcexpr::Bindings env{{"a", 2.0}, {"b", 3.0}, {"c", 4.0}};
    EXPECT_DOUBLE_EQ(calcexpr::evaluate(parse_ok("a + b * c"), env), 14.0);
    EXPECT_DOUBLE_EQ(calcexpr::evaluate(parse_ok("a - b - c"), env), -5.0);
    EXPECT_DOUBLE_EQ(calcexpr::evaluate(parse_ok("(a + b) * c"), env), 20.0);
}

TEST(Parser, EmptyInputIsNoFormula) {
    EXPECT_FALSE(calcexpr::parse("").has_value());
    EXPECT_FALSE(calcexpr::parse("   ").has_value());
    EXPECT_FALSE(calcexpr::parse(std::vector<calcexpr::Token>{}).has_value());
}

TEST(Parser, OnlyDroppedCharactersIsNoFormula) {
    EXPECT_FALSE(calcexpr::parse("$ ?").has_value());
}

TEST(Parser, MissingRightOperand) {
    EXPECT_EQ(parse_fail("a + "), ParseErrorKind::UnexpectedEndOfInput);
    EXPECT_EQ(parse_fail("a *"), ParseErrorKind::UnexpectedEndOfInput);
}

TEST(Parser, UnclosedParenthesis) {
    EXPECT_EQ(parse_fail("(a + b"), ParseErrorKind::UnexpectedEndOfInput);
    EXPECT_EQ(parse_fail("("), ParseErrorKind::UnexpectedEndOfInput);
}

TEST(Parser, AdjacentOperandsAreTrailing) {
    EXPECT_EQ(parse_fail("3 4"), ParseErrorKind::TrailingTokens);
    EXPECT_EQ(parse_fail("vw ae"), ParseErrorKind::TrailingTokens);
}

TEST(Parser, UnmatchedCloseParenthesis) {
    EXPECT_EQ(parse_fail("a + b)"), ParseErrorKind::UnexpectedToken);
    EXPECT_EQ(parse_fail("(a) * 2)"), ParseErrorKind::UnexpectedToken);
    EXPECT_EQ(parse_fail(")"), ParseErrorKind::UnexpectedToken);
}

TEST(Parser, OperatorWhereOperandExpected) {
    EXPECT_EQ(parse_fail("* a"), ParseErrorKind::UnexpectedToken);
    EXPECT_EQ(parse_fail("a + * b"), ParseErrorKind::UnexpectedToken);
    EXPECT_EQ(parse_fail("-a"), ParseErrorKind::UnexpectedToken);
    EXPECT_EQ(parse_fail("()"), ParseErrorKind::UnexpectedToken);
}

TEST(Parser, InnerParenthesisNotClosedByOperand) {
    EXPECT_EQ(parse_fail("(a b)"), ParseErrorKind::UnexpectedToken);
}

TEST(Parser, MalformedLiteralTokenRejected) {
    std::vector<calcexpr::Token> toks{{calcexpr::TokKind::Number, "1.2.3"}};
    try {
        calcexpr::parse(toks);
        FAIL() << "expected ParseError";
    } catch (const calcexpr::ParseError& e) {
        EXPECT_EQ(e.kind(), ParseErrorKind::UnexpectedToken);
    }
}

TEST(Parser, StrictOptionsAreForwarded) {
    try {
        calcexpr::parse("a # b", calcexpr::LexOptions{true});
        FAIL() << "expected ParseError";
    } catch (const calcexpr::ParseError& e) {
        EXPECT_EQ(e.kind(), ParseErrorKind::UnexpectedCharacter);
    }
}

static std::string chain(std::size_t terms) {
    std::string text = "a";
    for (std::size_t i = 1; i < terms; ++i) text += " + a";
    return text;
}

TEST(Parser, LongChainUpToDepthLimit) {
    auto e = calcexpr::parse(chain(calcexpr::kMaxExprDepth));
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->depth(), calcexpr::kMaxExprDepth);
    EXPECT_DOUBLE_EQ(calcexpr::evaluate(*e, {{"a", 1.0}}), static_cast<double>(calcexpr::kMaxExprDepth));
}

TEST(Parser, ChainPastDepthLimitIsRejected) {
    EXPECT_EQ(parse_fail(chain(calcexpr::kMaxExprDepth + 1)), ParseErrorKind::TooDeep);
}

TEST(Parser, DeepParenthesesAreRejectedNotCrashing) {
    std::string text = std::string(200000, '(') + "a" + std::string(200000, ')');
    EXPECT_EQ(parse_fail(text), ParseErrorKind::TooDeep);
}

TEST(Parser, ParenthesesUpToDepthLimit) {
    std::size_t n = calcexpr::kMaxExprDepth;
    auto e = calcexpr::parse(std::string(n, '(') + "vw" + std::string(n, ')'));
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(*e, v("vw"));

    EXPECT_EQ(parse_fail(std::string(n + 1, '(') + "vw" + std::string(n + 1, ')')), ParseErrorKind::TooDeep);
}

TEST(Parser, TrailingEndTokenIsAccepted) {
    using calcexpr::TokKind;
    std::vector<calcexpr::Token> toks{{TokKind::Ident, "a"}, {TokKind::Plus, ""},
                                      {TokKind::Ident, "b"}, {TokKind::End, ""}};
    auto e = calcexpr::parse(toks);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(*e, Expr::binary(Op::Add, v("a"), v("b")));

    EXPECT_FALSE(calcexpr::parse(std::vector<calcexpr::Token>{{TokKind::End, ""}}).has_value());
}

TEST(Parser, EndTokenInsideSequenceIsRejected) {
    using calcexpr::TokKind;
    std::vector<calcexpr::Token> middle{{TokKind::Ident, "a"}, {TokKind::End, ""}, {TokKind::Ident, "b"}};
    std::vector<calcexpr::Token> leading{{TokKind::End, ""}, {TokKind::Ident, "a"}};

    try {
        calcexpr::parse(middle);
        FAIL() << "expected ParseError";
    } catch (const calcexpr::ParseError& e) {
        EXPECT_EQ(e.kind(), ParseErrorKind::TrailingTokens);
    }
    try {
        calcexpr::parse(leading);
        FAIL() << "expected ParseError";
    } catch (const calcexpr::ParseError& e) {
        EXPECT_EQ(e.kind(), ParseErrorKind::UnexpectedToken);
    }
}

} // namespace
