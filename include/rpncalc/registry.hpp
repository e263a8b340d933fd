#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "rpncalc/error.hpp"
#include "rpncalc/value.hpp"

namespace rpncalc {

/// Accepted argument counts of a function: [min, max].
struct Arity {
    static constexpr std::size_t unbounded = static_cast<std::size_t>(-1);

    std::size_t min{0};
    std::size_t max{0};

    static Arity fixed(std::size_t n) { return Arity{n, n}; }
    static Arity variadic(std::size_t min, std::size_t max = unbounded) { return Arity{min, max}; }

    bool accepts(std::size_t n) const noexcept { return n >= min && n <= max; }
    bool is_variadic() const noexcept { return min != max; }
};

/// Arguments arrive in written order. A failure is reported as an Error
/// (normally OperationFailed) whose message the evaluator prefixes with the
/// function name.
using Callable = Result<Value> (*)(const std::vector<double>& args);

struct Function {
    Arity arity{};
    Callable apply{nullptr};
};

using ConstantTable = std::map<std::string, double, std::less<>>;
using FunctionTable = std::map<std::string, Function, std::less<>>;

/// Immutable name -> constant / name -> function lookup consulted by the
/// converter (constants, function names) and the evaluator (callables).
class Registry {
public:
    Registry() = default;
    Registry(ConstantTable constants, FunctionTable functions)
        : constants_(std::move(constants)), functions_(std::move(functions)) {}

    /// Built-in table of math constants and functions. Constructed once on
    /// first use; safe to share between threads afterwards.
    static const Registry& standard();

    const double* find_constant(std::string_view name) const;
    const Function* find_function(std::string_view name) const;

    const ConstantTable& constants() const noexcept { return constants_; }
    const FunctionTable& functions() const noexcept { return functions_; }

private:
    ConstantTable constants_;
    FunctionTable functions_;
};

} // namespace rpncalc
