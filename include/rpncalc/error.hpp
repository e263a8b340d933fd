#pragma once
#include <string>
#include <utility>
#include <variant>

namespace rpncalc {

enum class ErrorKind {
    EmptyExpression,
    UnknownToken,
    MissingFunctionParen,
    UnmatchedParenthesis,
    InvalidArity,
    OperationFailed,
    InvalidFinalResult,
};

const char* to_string(ErrorKind kind);

struct Error {
    ErrorKind kind{ErrorKind::InvalidFinalResult};
    std::string message{};
};

/// Value-or-Error returned by every pipeline stage.
/// Errors are returned, never thrown; callers check ok() and forward error().
template <class T>
class Result {
public:
    Result(T value) : v_(std::move(value)) {}
    Result(Error err) : v_(std::move(err)) {}

    bool ok() const noexcept { return std::holds_alternative<T>(v_); }
    explicit operator bool() const noexcept { return ok(); }

    const T& value() const& { return std::get<T>(v_); }
    T& value() & { return std::get<T>(v_); }
    T&& value() && { return std::get<T>(std::move(v_)); }

    const Error& error() const { return std::get<Error>(v_); }

private:
    std::variant<T, Error> v_;
};

inline Error make_error(ErrorKind kind, std::string message) {
    return Error{kind, std::move(message)};
}

} // namespace rpncalc
