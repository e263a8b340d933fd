#include <rpncalc/calculator.hpp>

#include <rpncalc/evaluator.hpp>
#include <rpncalc/lexer.hpp>
#include <rpncalc/parser.hpp>
#include <rpncalc/sign_normalizer.hpp>

#include <charconv>
#include <cmath>

namespace rpncalc {

Result<Value> calculate(std::string_view expression, const Registry& registry) {
    auto tokens = tokenize(expression);
    if (!tokens) return tokens.error();

    auto normalized = normalize_signs(tokens.value());
    if (!normalized) return normalized.error();

    auto rpn = to_rpn(normalized.value(), registry);
    if (!rpn) return rpn.error();

    return eval_rpn(rpn.value(), registry);
}

Result<Value> calculate(std::string_view expression) {
    return calculate(expression, Registry::standard());
}

std::string format_value(const Value& v) {
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? "True" : "False";

    const double x = std::get<double>(v);
    if (std::isnan(x)) return "nan";
    if (std::isinf(x)) return x < 0 ? "-inf" : "inf";

    const double mag = std::fabs(x);
    const bool scientific = mag != 0.0 && (mag >= 1e16 || mag < 1e-4);

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), x,
                             scientific ? std::chars_format::scientific : std::chars_format::fixed);
    std::string out(buf, res.ptr);
    if (!scientific && out.find('.') == std::string::npos) out += ".0";
    return out;
}

} // namespace rpncalc
