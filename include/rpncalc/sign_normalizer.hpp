#pragma once
#include <vector>
#include "rpncalc/error.hpp"
#include "rpncalc/token.hpp"

namespace rpncalc {

// Collapse every run of '+'/'-' into one sign (odd number of '-' => '-').
// A run at the start of the expression or after an operator, '(' or ','
// is unary: it becomes a Neg token, or disappears when it collapsed to '+'.
// Any other run stays a binary Plus/Minus.
//
// A run with no operand after it fails with UnknownToken.
Result<std::vector<Token>> normalize_signs(const std::vector<Token>& tokens);

} // namespace rpncalc
