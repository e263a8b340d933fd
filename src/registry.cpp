#include "rpncalc/registry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace rpncalc {

using Args = std::vector<double>;

namespace {

constexpr double kPi = 3.141592653589793;
constexpr double kE = 2.718281828459045;
// Largest double below which every integer is exactly representable.
constexpr double kMaxExactInt = 9007199254740992.0;

Error domain_error() { return make_error(ErrorKind::OperationFailed, "math domain error"); }
Error range_error() { return make_error(ErrorKind::OperationFailed, "math range error"); }

// Same rule the host math library applies to its real functions: NaN out of
// non-NaN input is a domain error, infinity out of finite input an overflow.
Result<Value> real(double r, const Args& args) {
    const bool any_nan = std::any_of(args.begin(), args.end(), [](double x) { return std::isnan(x); });
    const bool all_finite = std::all_of(args.begin(), args.end(), [](double x) { return std::isfinite(x); });

    if (std::isnan(r) && !any_nan) return domain_error();
    if (std::isinf(r) && all_finite) return range_error();
    return Value{r};
}

bool is_integral(double x) {
    return std::isfinite(x) && std::trunc(x) == x && std::fabs(x) <= kMaxExactInt;
}

Result<Value> integral_required() {
    return make_error(ErrorKind::OperationFailed, "integer argument expected");
}

Result<Value> factorial(const Args& a) {
    if (!is_integral(a[0])) return integral_required();
    if (a[0] < 0) return make_error(ErrorKind::OperationFailed, "factorial() not defined for negative values");
    double acc = 1.0;
    for (double i = 2.0; i <= a[0] && std::isfinite(acc); i += 1.0) acc *= i;
    return real(acc, a);
}

// n! / (n-k)!, optionally divided by k! (comb).
Result<Value> falling_product(double n, double k, bool divide_by_k_factorial, const Args& a) {
    if (!is_integral(n) || !is_integral(k)) return integral_required();
    if (n < 0 || k < 0) return make_error(ErrorKind::OperationFailed, "n and k must be non-negative integers");
    if (k > n) return Value{0.0};

    if (divide_by_k_factorial) k = std::min(k, n - k);
    double acc = 1.0;
    for (double i = 1.0; i <= k && std::isfinite(acc); i += 1.0) {
        acc *= (n - k + i);
        if (divide_by_k_factorial) acc /= i;
    }
    if (divide_by_k_factorial) acc = std::round(acc);
    return real(acc, a);
}

Result<Value> isqrt(const Args& a) {
    if (!is_integral(a[0])) return integral_required();
    if (a[0] < 0) return make_error(ErrorKind::OperationFailed, "isqrt() argument must be nonnegative");
    double r = std::floor(std::sqrt(a[0]));
    while (r * r > a[0]) r -= 1.0;
    while ((r + 1.0) * (r + 1.0) <= a[0]) r += 1.0;
    return Value{r};
}

double gcd2(double x, double y) {
    x = std::fabs(x);
    y = std::fabs(y);
    while (y != 0.0) {
        double t = std::fmod(x, y);
        x = y;
        y = t;
    }
    return x;
}

Result<Value> gcd(const Args& a) {
    double acc = 0.0;
    for (double x : a) {
        if (!is_integral(x)) return integral_required();
        acc = gcd2(acc, x);
    }
    return Value{acc};
}

Result<Value> lcm(const Args& a) {
    double acc = 1.0;
    for (double x : a) {
        if (!is_integral(x)) return integral_required();
        if (x == 0.0 || acc == 0.0) {
            acc = 0.0;
            continue;
        }
        acc = std::fabs(acc / gcd2(acc, x) * x);
    }
    return real(acc, a);
}

// Half-to-even, like the host's round().
Result<Value> round_half_even(const Args& a) {
    if (a.size() == 1) return real(std::nearbyint(a[0]), a);

    if (!is_integral(a[1])) return integral_required();
    if (!std::isfinite(a[0])) return Value{a[0]};
    const double scale = std::pow(10.0, std::fabs(a[1]));
    if (!std::isfinite(scale)) return Value{a[1] > 0 ? a[0] : 0.0 * a[0]};

    double r = a[1] >= 0 ? std::nearbyint(a[0] * scale) / scale
                         : std::nearbyint(a[0] / scale) * scale;
    if (!std::isfinite(r)) return Value{a[0]};
    return real(r, a);
}

Result<Value> logarithm(const Args& a) {
    if (a.size() == 1) return real(std::log(a[0]), a);
    return real(std::log(a[0]) / std::log(a[1]), a);
}

Result<Value> load_exponent(const Args& a) {
    if (!is_integral(a[1])) return integral_required();
    const double e = std::clamp(a[1], -100000.0, 100000.0);
    return real(std::ldexp(a[0], static_cast<int>(e)), a);
}

Result<Value> ulp(const Args& a) {
    double x = std::fabs(a[0]);
    if (!std::isfinite(x)) return Value{x};
    double up = std::nextafter(x, std::numeric_limits<double>::infinity());
    if (std::isinf(up)) return Value{x - std::nextafter(x, 0.0)};
    return Value{up - x};
}

// isclose(a, b[, rel_tol[, abs_tol]]), tolerances given positionally.
Result<Value> isclose(const Args& a) {
    const double rel_tol = a.size() > 2 ? a[2] : 1e-09;
    const double abs_tol = a.size() > 3 ? a[3] : 0.0;
    if (rel_tol < 0.0 || abs_tol < 0.0) {
        return make_error(ErrorKind::OperationFailed, "tolerances must be non-negative");
    }

    const double x = a[0];
    const double y = a[1];
    if (x == y) return Value{true};
    if (std::isinf(x) || std::isinf(y)) return Value{false};
    const double diff = std::fabs(y - x);
    return Value{diff <= std::fabs(rel_tol * y) || diff <= std::fabs(rel_tol * x) || diff <= abs_tol};
}

FunctionTable make_functions() {
    FunctionTable f;

    const Arity one = Arity::fixed(1);
    const Arity two = Arity::fixed(2);

    f["acos"]  = {one, [](const Args& a) { return real(std::acos(a[0]), a); }};
    f["acosh"] = {one, [](const Args& a) { return real(std::acosh(a[0]), a); }};
    f["asin"]  = {one, [](const Args& a) { return real(std::asin(a[0]), a); }};
    f["asinh"] = {one, [](const Args& a) { return real(std::asinh(a[0]), a); }};
    f["atan"]  = {one, [](const Args& a) { return real(std::atan(a[0]), a); }};
    f["atanh"] = {one, [](const Args& a) { return real(std::atanh(a[0]), a); }};
    f["cbrt"]  = {one, [](const Args& a) { return real(std::cbrt(a[0]), a); }};
    f["ceil"]  = {one, [](const Args& a) { return real(std::ceil(a[0]), a); }};
    f["cos"]   = {one, [](const Args& a) { return real(std::cos(a[0]), a); }};
    f["cosh"]  = {one, [](const Args& a) { return real(std::cosh(a[0]), a); }};
    f["degrees"] = {one, [](const Args& a) { return real(a[0] * (180.0 / kPi), a); }};
    f["erf"]   = {one, [](const Args& a) { return real(std::erf(a[0]), a); }};
    f["erfc"]  = {one, [](const Args& a) { return real(std::erfc(a[0]), a); }};
    f["exp"]   = {one, [](const Args& a) { return real(std::exp(a[0]), a); }};
    f["exp2"]  = {one, [](const Args& a) { return real(std::exp2(a[0]), a); }};
    f["expm1"] = {one, [](const Args& a) { return real(std::expm1(a[0]), a); }};
    f["fabs"]  = {one, [](const Args& a) { return real(std::fabs(a[0]), a); }};
    f["floor"] = {one, [](const Args& a) { return real(std::floor(a[0]), a); }};
    f["gamma"] = {one, [](const Args& a) { return real(std::tgamma(a[0]), a); }};
    f["lgamma"] = {one, [](const Args& a) { return real(std::lgamma(a[0]), a); }};
    f["log10"] = {one, [](const Args& a) { return real(std::log10(a[0]), a); }};
    f["log1p"] = {one, [](const Args& a) { return real(std::log1p(a[0]), a); }};
    f["log2"]  = {one, [](const Args& a) { return real(std::log2(a[0]), a); }};
    f["radians"] = {one, [](const Args& a) { return real(a[0] * (kPi / 180.0), a); }};
    f["sin"]   = {one, [](const Args& a) { return real(std::sin(a[0]), a); }};
    f["sinh"]  = {one, [](const Args& a) { return real(std::sinh(a[0]), a); }};
    f["sqrt"]  = {one, [](const Args& a) { return real(std::sqrt(a[0]), a); }};
    f["tan"]   = {one, [](const Args& a) { return real(std::tan(a[0]), a); }};
    f["tanh"]  = {one, [](const Args& a) { return real(std::tanh(a[0]), a); }};
    f["trunc"] = {one, [](const Args& a) { return real(std::trunc(a[0]), a); }};
    f["abs"]   = {one, [](const Args& a) { return real(std::fabs(a[0]), a); }};

    f["isfinite"] = {one, [](const Args& a) -> Result<Value> { return Value{std::isfinite(a[0]) != 0}; }};
    f["isinf"]    = {one, [](const Args& a) -> Result<Value> { return Value{std::isinf(a[0]) != 0}; }};
    f["isnan"]    = {one, [](const Args& a) -> Result<Value> { return Value{std::isnan(a[0]) != 0}; }};

    f["factorial"] = {one, factorial};
    f["isqrt"]     = {one, isqrt};
    f["ulp"]       = {one, ulp};

    f["atan2"]     = {two, [](const Args& a) { return real(std::atan2(a[0], a[1]), a); }};
    f["copysign"]  = {two, [](const Args& a) { return real(std::copysign(a[0], a[1]), a); }};
    f["fmod"]      = {two, [](const Args& a) { return real(std::fmod(a[0], a[1]), a); }};
    f["hypot"]     = {two, [](const Args& a) { return real(std::hypot(a[0], a[1]), a); }};
    f["nextafter"] = {two, [](const Args& a) { return real(std::nextafter(a[0], a[1]), a); }};
    f["pow"]       = {two, [](const Args& a) { return real(std::pow(a[0], a[1]), a); }};
    f["remainder"] = {two, [](const Args& a) { return real(std::remainder(a[0], a[1]), a); }};
    f["ldexp"]     = {two, load_exponent};
    f["comb"]      = {two, [](const Args& a) { return falling_product(a[0], a[1], true, a); }};

    f["perm"] = {Arity::variadic(1, 2), [](const Args& a) {
        if (a.size() == 1) return factorial(a);
        return falling_product(a[0], a[1], false, a);
    }};
    f["log"]   = {Arity::variadic(1, 2), logarithm};
    f["round"] = {Arity::variadic(1, 2), round_half_even};
    f["isclose"] = {Arity::variadic(2, 4), isclose};
    f["gcd"]   = {Arity::variadic(0), gcd};
    f["lcm"]   = {Arity::variadic(0), lcm};

    return f;
}

} // namespace

const Registry& Registry::standard() {
    static const Registry instance{
        ConstantTable{
            {"e", kE},
            {"inf", std::numeric_limits<double>::infinity()},
            {"nan", std::numeric_limits<double>::quiet_NaN()},
            {"pi", kPi},
            {"tau", 2.0 * kPi},
        },
        make_functions(),
    };
    return instance;
}

const double* Registry::find_constant(std::string_view name) const {
    auto it = constants_.find(name);
    if (it == constants_.end()) return nullptr;
    return &it->second;
}

const Function* Registry::find_function(std::string_view name) const {
    auto it = functions_.find(name);
    if (it == functions_.end()) return nullptr;
    return &it->second;
}

} // namespace rpncalc
