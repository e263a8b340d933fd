#include "rpncalc/parser.hpp"
#include <string>
#include <utility>

namespace rpncalc {

static int precedence(TokKind k) {
    switch (k) {
        case TokKind::Neg:         return 4;
        case TokKind::Caret:       return 3;
        case TokKind::Star:
        case TokKind::Slash:
        case TokKind::DoubleSlash:
        case TokKind::Percent:     return 2;
        case TokKind::Plus:
        case TokKind::Minus:       return 1;
        default:                   return 0; // comparisons, parentheses
    }
}

static bool is_right_assoc(TokKind k) { return k == TokKind::Caret; }

// Shunting-yard with function calls + commas.
// A Func marker sits directly below its '(' on the operator stack; its arity
// starts at 1 and grows by one per comma of the call.
Result<std::vector<Token>> to_rpn(const std::vector<Token>& tokens, const Registry& registry) {
    std::vector<Token> output;
    std::vector<Token> opstack;
    output.reserve(tokens.size());

    auto pop_to_lparen = [&]() {
        while (!opstack.empty() && opstack.back().kind != TokKind::LParen) {
            output.push_back(std::move(opstack.back()));
            opstack.pop_back();
        }
    };

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const Token& t = tokens[i];

        if (t.kind == TokKind::Number) {
            output.push_back(t);
            continue;
        }

        if (t.kind == TokKind::Ident) {
            if (const double* c = registry.find_constant(t.text)) {
                Token num{TokKind::Number, t.text};
                num.number = *c;
                output.push_back(std::move(num));
                continue;
            }
            if (registry.find_function(t.text)) {
                if (i + 1 >= tokens.size() || tokens[i + 1].kind != TokKind::LParen) {
                    return make_error(ErrorKind::MissingFunctionParen,
                                      "Expected '(' after function '" + t.text + "'");
                }
                Token fn{TokKind::Func, t.text};
                fn.arity = 1;
                opstack.push_back(std::move(fn));
                continue;
            }
            return make_error(ErrorKind::UnknownToken, "Unknown token: '" + t.text + "'");
        }

        if (t.kind == TokKind::LParen) {
            opstack.push_back(t);
            continue;
        }

        if (t.kind == TokKind::RParen) {
            pop_to_lparen();
            if (opstack.empty()) return make_error(ErrorKind::UnmatchedParenthesis, "Mismatched ')'");
            opstack.pop_back(); // pop '('

            if (!opstack.empty() && opstack.back().kind == TokKind::Func) {
                Token fn = std::move(opstack.back());
                opstack.pop_back();
                // "f()" has no arguments at all
                if (fn.arity == 1 && i > 0 && tokens[i - 1].kind == TokKind::LParen) fn.arity = 0;
                output.push_back(std::move(fn));
            }
            continue;
        }

        if (t.kind == TokKind::Comma) {
            pop_to_lparen();
            if (opstack.empty()) {
                return make_error(ErrorKind::UnmatchedParenthesis, "',' outside of parentheses");
            }
            auto fn = opstack.rbegin();
            while (fn != opstack.rend() && fn->kind != TokKind::Func) ++fn;
            if (fn == opstack.rend()) {
                return make_error(ErrorKind::UnknownToken, "',' outside of a function call");
            }
            fn->arity += 1;
            continue;
        }

        if (t.kind == TokKind::Neg) {
            opstack.push_back(t); // prefix: nothing to its left to pop
            continue;
        }

        if (is_comparison(t.kind)) {
            pop_to_lparen();
            opstack.push_back(t);
            continue;
        }

        if (is_arithmetic(t.kind)) {
            const int pcur = precedence(t.kind);
            while (!opstack.empty() && is_operator(opstack.back().kind)) {
                const int ptop = precedence(opstack.back().kind);

                bool pop_it = is_right_assoc(t.kind) ? (ptop > pcur) : (ptop >= pcur);
                if (!pop_it) break;

                output.push_back(std::move(opstack.back()));
                opstack.pop_back();
            }
            opstack.push_back(t);
            continue;
        }

        return make_error(ErrorKind::UnknownToken, "Unexpected token: '" + t.text + "'");
    }

    while (!opstack.empty()) {
        if (opstack.back().kind == TokKind::LParen) {
            return make_error(ErrorKind::UnmatchedParenthesis, "Mismatched '('");
        }
        output.push_back(std::move(opstack.back()));
        opstack.pop_back();
    }
    return output;
}

} // namespace rpncalc
