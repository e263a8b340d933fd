#pragma once
#include <string>

namespace rpncalc {

enum class TokKind {
    Number,
    Ident,

    Plus, Minus, Star, Slash, DoubleSlash, Percent, Caret,
    Eq, Ne, Lt, Gt, Le, Ge,
    LParen, RParen,
    Comma,
    End,

    // internal
    Neg,   // unary -
    Func,  // function call marker (name + arity)
};

struct Token {
    TokKind kind{TokKind::End};
    std::string text{}; // source lexeme / Func name
    double number{0.0}; // Number
    int arity{0};       // Func
};

inline bool is_arithmetic(TokKind k) {
    switch (k) {
        case TokKind::Plus:
        case TokKind::Minus:
        case TokKind::Star:
        case TokKind::Slash:
        case TokKind::DoubleSlash:
        case TokKind::Percent:
        case TokKind::Caret:
            return true;
        default:
            return false;
    }
}

inline bool is_comparison(TokKind k) {
    switch (k) {
        case TokKind::Eq:
        case TokKind::Ne:
        case TokKind::Lt:
        case TokKind::Gt:
        case TokKind::Le:
        case TokKind::Ge:
            return true;
        default:
            return false;
    }
}

inline bool is_operator(TokKind k) {
    return is_arithmetic(k) || is_comparison(k) || k == TokKind::Neg;
}

} // namespace rpncalc
