#include "rpncalc/sign_normalizer.hpp"

namespace rpncalc {

static bool starts_operand(const std::vector<Token>& out) {
    if (out.empty()) return true;
    TokKind k = out.back().kind;
    return is_operator(k) || k == TokKind::LParen || k == TokKind::Comma;
}

Result<std::vector<Token>> normalize_signs(const std::vector<Token>& tokens) {
    std::vector<Token> out;
    out.reserve(tokens.size());

    int minus_count = 0;
    int sign_count = 0;

    for (const auto& t : tokens) {
        if (t.kind == TokKind::Plus) {
            ++sign_count;
            continue;
        }
        if (t.kind == TokKind::Minus) {
            ++minus_count;
            ++sign_count;
            continue;
        }

        if (sign_count != 0) {
            const bool negative = (minus_count % 2) != 0;
            if (starts_operand(out)) {
                if (negative) out.push_back(Token{TokKind::Neg, "-"});
            } else if (negative) {
                out.push_back(Token{TokKind::Minus, "-"});
            } else {
                out.push_back(Token{TokKind::Plus, "+"});
            }
            minus_count = 0;
            sign_count = 0;
        }

        out.push_back(t);
    }

    if (sign_count != 0) {
        return make_error(ErrorKind::UnknownToken, "Dangling sign at end of expression");
    }
    return out;
}

} // namespace rpncalc
