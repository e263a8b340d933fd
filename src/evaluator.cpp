#include "rpncalc/evaluator.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace rpncalc {

static Error operation_failed(const std::string& op, const std::string& what) {
    return make_error(ErrorKind::OperationFailed, op + ": " + what);
}

// Floored modulo: the result takes the sign of the divisor.
static double floored_mod(double x, double y) {
    double mod = std::fmod(x, y);
    if (mod != 0.0) {
        if ((y < 0) != (mod < 0)) mod += y;
    } else {
        mod = std::copysign(0.0, y);
    }
    return mod;
}

static double floor_div(double x, double y) {
    double mod = std::fmod(x, y);
    double div = (x - mod) / y;
    if (mod != 0.0 && (y < 0) != (mod < 0)) div -= 1.0;

    if (div == 0.0) return std::copysign(0.0, x / y);
    double q = std::floor(div);
    if (div - q > 0.5) q += 1.0;
    return q;
}

static Result<Value> power(double x, double y) {
    if (x == 0.0 && y < 0.0) return operation_failed("^", "zero cannot be raised to a negative power");
    if (x < 0.0 && std::isfinite(x) && std::isfinite(y) && std::trunc(y) != y) {
        return operation_failed("^", "negative number cannot be raised to a fractional power");
    }
    double r = std::pow(x, y);
    if (std::isinf(r) && std::isfinite(x) && std::isfinite(y)) return operation_failed("^", "numerical result out of range");
    return Value{r};
}

Result<Value> apply_binary(TokKind op, const Value& a, const Value& b) {
    const double x = as_number(a);
    const double y = as_number(b);

    switch (op) {
        case TokKind::Plus:  return Value{x + y};
        case TokKind::Minus: return Value{x - y};
        case TokKind::Star:  return Value{x * y};
        case TokKind::Slash:
            if (y == 0.0) return operation_failed("/", "division by zero");
            return Value{x / y};
        case TokKind::DoubleSlash:
            if (y == 0.0) return operation_failed("//", "integer division or modulo by zero");
            return Value{floor_div(x, y)};
        case TokKind::Percent:
            if (y == 0.0) return operation_failed("%", "modulo by zero");
            return Value{floored_mod(x, y)};
        case TokKind::Caret: return power(x, y);

        case TokKind::Eq: return Value{x == y};
        case TokKind::Ne: return Value{x != y};
        case TokKind::Lt: return Value{x < y};
        case TokKind::Gt: return Value{x > y};
        case TokKind::Le: return Value{x <= y};
        case TokKind::Ge: return Value{x >= y};
        default: break;
    }
    return make_error(ErrorKind::UnknownToken, "Unsupported binary operator");
}

static Result<Value> call_function(const Token& fn, std::vector<Value>& st, const Registry& registry) {
    const Function* f = registry.find_function(fn.text);
    if (!f) return make_error(ErrorKind::UnknownToken, "Unknown function: " + fn.text);

    if (fn.arity < 0 || !f->arity.accepts(static_cast<std::size_t>(fn.arity))) {
        return make_error(ErrorKind::InvalidArity,
                          fn.text + "() does not accept " + std::to_string(fn.arity) + " argument(s)");
    }
    const auto argc = static_cast<std::size_t>(fn.arity);
    if (argc > st.size()) {
        return make_error(ErrorKind::InvalidFinalResult, "Not enough arguments for " + fn.text + "()");
    }

    // args[0] is the first argument as written.
    std::vector<double> args(argc);
    for (std::size_t i = argc; i > 0; --i) {
        args[i - 1] = as_number(st.back());
        st.pop_back();
    }

    Result<Value> r = f->apply(args);
    if (!r) return operation_failed(fn.text, r.error().message);
    return r;
}

Result<Value> eval_rpn(const std::vector<Token>& rpn, const Registry& registry) {
    std::vector<Value> st;
    st.reserve(rpn.size());

    auto underflow = [](const Token& t) {
        return make_error(ErrorKind::InvalidFinalResult, "Missing operand for '" + t.text + "'");
    };

    for (const auto& t : rpn) {
        switch (t.kind) {
            case TokKind::Number:
                st.emplace_back(t.number);
                break;

            case TokKind::Neg: {
                if (st.empty()) return underflow(t);
                double v = as_number(st.back());
                st.back() = Value{-v};
                break;
            }

            case TokKind::Func: {
                Result<Value> r = call_function(t, st, registry);
                if (!r) return r.error();
                st.push_back(std::move(r).value());
                break;
            }

            default: {
                if (!is_arithmetic(t.kind) && !is_comparison(t.kind)) {
                    return make_error(ErrorKind::UnknownToken, "Unexpected token during evaluation: '" + t.text + "'");
                }
                if (st.size() < 2) return underflow(t);
                Value b = std::move(st.back());
                st.pop_back();
                Value a = std::move(st.back());
                st.pop_back();

                Result<Value> r = apply_binary(t.kind, a, b);
                if (!r) return r.error();
                st.push_back(std::move(r).value());
                break;
            }
        }
    }

    if (st.size() != 1) {
        return make_error(ErrorKind::InvalidFinalResult,
                          st.empty() ? "Expression produced no value"
                                     : "Expression did not reduce to a single value");
    }
    return st.back();
}

} // namespace rpncalc
