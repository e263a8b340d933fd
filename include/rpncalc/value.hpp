#pragma once
#include <variant>

namespace rpncalc {

/// Result of an expression: arithmetic yields double, comparisons yield bool.
using Value = std::variant<double, bool>;

/// Booleans take part in arithmetic as 1.0 / 0.0.
inline double as_number(const Value& v) {
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? 1.0 : 0.0;
    return std::get<double>(v);
}

} // namespace rpncalc
