#pragma once

#include <string>
#include <string_view>

#include <rpncalc/error.hpp>
#include <rpncalc/registry.hpp>
#include <rpncalc/value.hpp>

namespace rpncalc {

/// Evaluate one expression: tokenize -> normalize signs -> RPN -> evaluate.
/// Stops at the first failing stage and returns its error.
Result<Value> calculate(std::string_view expression, const Registry& registry);

/// Same, against Registry::standard().
Result<Value> calculate(std::string_view expression);

/// Render a result for display: True/False for comparisons, shortest
/// round-trip decimal for numbers ("5.0", "0.1", "1e+16", "inf").
std::string format_value(const Value& v);

} // namespace rpncalc
