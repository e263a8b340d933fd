#include "rpncalc/lexer.hpp"
#include <cctype>
#include <cstdlib>
#include <utility>
#include <string>

namespace rpncalc {

static bool is_ws(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Decimal literal only: "12", ".5", "4.", "1e5". Hex and inf/nan spellings
// are left to the registry as identifiers.
static bool parse_number(const std::string& text, double& out) {
    if (text.empty()) return false;
    const char c = text[0];
    if (!std::isdigit(static_cast<unsigned char>(c)) && c != '.') return false;
    if (text.find_first_of("xX") != std::string::npos) return false;

    const char* begin = text.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end != begin + text.size()) return false;
    out = v;
    return true;
}

void Lexer::skip_ws() {
    while (!is_end() && is_ws(s_[i_])) ++i_;
}

bool Lexer::at_delimiter() const {
    char c = s_[i_];
    switch (c) {
        case '+': case '-': case '*': case '/': case '%': case '^':
        case '<': case '>':
        case '(': case ')': case ',':
            return true;
        case '=':
        case '!':
            // only as the first half of "==" / "!="
            return i_ + 1 < s_.size() && s_[i_ + 1] == '=';
        default:
            return is_ws(c);
    }
}

Token Lexer::word() {
    std::size_t start = i_;
    while (!is_end() && !at_delimiter()) ++i_;

    Token t;
    t.text = std::string(s_.substr(start, i_ - start));
    t.kind = parse_number(t.text, t.number) ? TokKind::Number : TokKind::Ident;
    return t;
}

Token Lexer::next() {
    skip_ws();
    if (is_end()) return {TokKind::End};

    char c = s_[i_];
    const bool followed_by_eq = i_ + 1 < s_.size() && s_[i_ + 1] == '=';

    switch (c) {
        case '+': ++i_; return {TokKind::Plus, "+"};
        case '-': ++i_; return {TokKind::Minus, "-"};
        case '*': ++i_; return {TokKind::Star, "*"};
        case '%': ++i_; return {TokKind::Percent, "%"};
        case '^': ++i_; return {TokKind::Caret, "^"};
        case '(': ++i_; return {TokKind::LParen, "("};
        case ')': ++i_; return {TokKind::RParen, ")"};
        case ',': ++i_; return {TokKind::Comma, ","};
        case '/':
            if (i_ + 1 < s_.size() && s_[i_ + 1] == '/') {
                i_ += 2;
                return {TokKind::DoubleSlash, "//"};
            }
            ++i_;
            return {TokKind::Slash, "/"};
        case '<':
            if (followed_by_eq) { i_ += 2; return {TokKind::Le, "<="}; }
            ++i_;
            return {TokKind::Lt, "<"};
        case '>':
            if (followed_by_eq) { i_ += 2; return {TokKind::Ge, ">="}; }
            ++i_;
            return {TokKind::Gt, ">"};
        case '=':
            if (followed_by_eq) { i_ += 2; return {TokKind::Eq, "=="}; }
            break;
        case '!':
            if (followed_by_eq) { i_ += 2; return {TokKind::Ne, "!="}; }
            break;
        default: break;
    }

    return word();
}

Result<std::vector<Token>> tokenize(std::string_view expression) {
    Lexer lex(expression);
    std::vector<Token> out;

    for (Token t = lex.next(); t.kind != TokKind::End; t = lex.next()) {
        out.push_back(std::move(t));
    }
    if (out.empty()) return make_error(ErrorKind::EmptyExpression, "Empty expression");
    return out;
}

} // namespace rpncalc
