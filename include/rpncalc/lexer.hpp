#pragma once
#include <string_view>
#include <vector>
#include "rpncalc/error.hpp"
#include "rpncalc/token.hpp"

namespace rpncalc {

class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}

    // Returns End once the input is exhausted. Any run of characters that is
    // not a delimiter becomes a Number or an Ident, so next() never fails.
    Token next();

private:
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }
    bool at_delimiter() const;
    Token word();

    std::string_view s_;
    std::size_t i_{0};
};

/// Split an expression into tokens (without the trailing End).
/// Fails with EmptyExpression for empty or whitespace-only input.
Result<std::vector<Token>> tokenize(std::string_view expression);

} // namespace rpncalc
