#pragma once
#include <vector>
#include "rpncalc/error.hpp"
#include "rpncalc/registry.hpp"
#include "rpncalc/token.hpp"
#include "rpncalc/value.hpp"

namespace rpncalc {

/// Evaluate an RPN token stream (as produced by to_rpn) with a single value
/// stack. Function tokens are looked up in `registry` and called with
/// exactly `arity` operands.
Result<Value> eval_rpn(const std::vector<Token>& rpn, const Registry& registry);

/// Apply one binary arithmetic or comparison operator.
/// Fails with OperationFailed on division by zero and non-real powers.
Result<Value> apply_binary(TokKind op, const Value& a, const Value& b);

} // namespace rpncalc
