#pragma once
#include <vector>
#include "rpncalc/error.hpp"
#include "rpncalc/registry.hpp"
#include "rpncalc/token.hpp"

namespace rpncalc {

// Convert sign-normalized infix tokens into Reverse Polish Notation.
// Constants are resolved to Number tokens here; function calls are emitted as
// Func tokens carrying the argument count seen at the call site.
Result<std::vector<Token>> to_rpn(const std::vector<Token>& tokens, const Registry& registry);

} // namespace rpncalc
