#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace calcexpr {

enum class ParseErrorKind {
    UnexpectedToken,
    UnexpectedEndOfInput,
    TrailingTokens,
    UnexpectedCharacter, // strict lexing only
    TooDeep,             // tree or parentheses nested beyond kMaxExprDepth
};

struct ParseError : std::runtime_error {
    ParseError(ParseErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ParseErrorKind kind() const noexcept { return kind_; }

private:
    ParseErrorKind kind_;
};

enum class EvalErrorKind {
    UnboundVariable,
    DivisionByZero,
};

struct EvalError : std::runtime_error {
    EvalError(EvalErrorKind kind, const std::string& what, std::string variable = {})
        : std::runtime_error(what), kind_(kind), variable_(std::move(variable)) {}

    EvalErrorKind kind() const noexcept { return kind_; }
    // Name of the missing variable for UnboundVariable, empty otherwise.
    const std::string& variable() const noexcept { return variable_; }

private:
    EvalErrorKind kind_;
    std::string variable_;
};

// Malformed or invalid persisted formula document.
struct FormatError : std::runtime_error { using std::runtime_error::runtime_error; };

} // namespace calcexpr
