#pragma once
#include <string>

namespace calcexpr {

enum class TokKind {
    Ident,
    Number,

    Plus, Minus, Star, Slash,
    LParen, RParen,

    End, // streaming lexer only; never stored by tokenize()
};

struct Token {
    TokKind kind{TokKind::End};
    std::string text{}; // Ident name / Number literal text
};

inline bool operator==(const Token& a, const Token& b) {
    return a.kind == b.kind && a.text == b.text;
}
inline bool operator!=(const Token& a, const Token& b) { return !(a == b); }

} // namespace calcexpr
