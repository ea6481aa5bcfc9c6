#pragma once
#include <string_view>
#include <vector>
#include "calcexpr/errors.hpp"
#include "calcexpr/token.hpp"

namespace calcexpr {

struct LexOptions {
    // Reject characters outside the formula alphabet instead of dropping them.
    // Whitespace is always a separator.
    bool strict = false;
};

class Lexer {
public:
    explicit Lexer(std::string_view s, LexOptions opts = {}) : s_(s), opts_(opts) {}
    Token next();

private:
    void skip_separators();
    bool is_end() const { return i_ >= s_.size(); }

    std::string_view s_;
    LexOptions opts_;
    std::size_t i_{0};
};

/// Split formula text into tokens, left to right, without a trailing End.
/// Never throws in lenient mode.
std::vector<Token> tokenize(std::string_view text, const LexOptions& opts = {});

} // namespace calcexpr
