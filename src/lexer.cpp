#include "calcexpr/lexer.hpp"
#include <cctype>
#include <fmt/format.h>

namespace calcexpr {

static bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}
static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}
static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}
static bool is_token_start(char c) {
    switch (c) {
        case '+': case '-': case '*': case '/': case '(': case ')':
            return true;
        default:
            return is_ident_start(c) || is_digit(c);
    }
}

void Lexer::skip_separators() {
    while (!is_end() && !is_token_start(s_[i_])) {
        char c = s_[i_];
        if (opts_.strict && !std::isspace(static_cast<unsigned char>(c))) {
            throw ParseError(ParseErrorKind::UnexpectedCharacter,
                             fmt::format("Unexpected character '{}' at offset {}", c, i_));
        }
        ++i_;
    }
}

Token Lexer::next() {
    skip_separators();
    if (is_end()) return {TokKind::End};

    char c = s_[i_];

    switch (c) {
        case '+': ++i_; return {TokKind::Plus};
        case '-': ++i_; return {TokKind::Minus};
        case '*': ++i_; return {TokKind::Star};
        case '/': ++i_; return {TokKind::Slash};
        case '(': ++i_; return {TokKind::LParen};
        case ')': ++i_; return {TokKind::RParen};
        default: break;
    }

    if (is_ident_start(c)) {
        std::size_t start = i_++;
        while (!is_end() && is_ident_char(s_[i_])) ++i_;
        return {TokKind::Ident, std::string(s_.substr(start, i_ - start))};
    }

    // digits, then at most one '.' and only when a digit follows it
    std::size_t start = i_;
    while (!is_end() && is_digit(s_[i_])) ++i_;
    if (i_ + 1 < s_.size() && s_[i_] == '.' && is_digit(s_[i_ + 1])) {
        ++i_;
        while (!is_end() && is_digit(s_[i_])) ++i_;
    }
    return {TokKind::Number, std::string(s_.substr(start, i_ - start))};
}

std::vector<Token> tokenize(std::string_view text, const LexOptions& opts) {
    Lexer lex(text, opts);
    std::vector<Token> out;
    for (Token t = lex.next(); t.kind != TokKind::End; t = lex.next()) {
        out.push_back(std::move(t));
    }
    return out;
}

} // namespace calcexpr
