#include "rpncalc/error.hpp"

namespace rpncalc {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::EmptyExpression:      return "EmptyExpressionError";
        case ErrorKind::UnknownToken:         return "UnknownTokenError";
        case ErrorKind::MissingFunctionParen: return "MissingFunctionParenError";
        case ErrorKind::UnmatchedParenthesis: return "UnmatchedParenthesisError";
        case ErrorKind::InvalidArity:         return "InvalidArityError";
        case ErrorKind::OperationFailed:      return "OperationFailedError";
        case ErrorKind::InvalidFinalResult:   return "InvalidFinalResultError";
    }
    return "UnknownError";
}

} // namespace rpncalc
