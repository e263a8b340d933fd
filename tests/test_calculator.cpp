#include <gtest/gtest.h>
#include <rpncalc/calculator.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <variant>

namespace {

using rpncalc::ErrorKind;

const double pi = std::acos(-1.0);
const double e = std::exp(1.0);
const double tau = 2.0 * pi;

double calc(const std::string& input) {
    auto r = rpncalc::calculate(input);
    EXPECT_TRUE(r.ok()) << input << ": " << (r ? "" : r.error().message);
    if (!r) return std::nan("");
    return rpncalc::as_number(r.value());
}

bool truthy(const std::string& input) {
    auto r = rpncalc::calculate(input);
    EXPECT_TRUE(r.ok()) << input << ": " << (r ? "" : r.error().message);
    if (!r) return false;
    EXPECT_TRUE(std::holds_alternative<bool>(r.value())) << input;
    return rpncalc::as_number(r.value()) != 0.0;
}

ErrorKind failure(const std::string& input) {
    auto r = rpncalc::calculate(input);
    EXPECT_FALSE(r.ok()) << input;
    return r ? ErrorKind::InvalidFinalResult : r.error().kind;
}

TEST(Calculator, UnaryOperations) {
    EXPECT_DOUBLE_EQ(calc("+1"), 1.0);
    EXPECT_DOUBLE_EQ(calc("-1"), -1.0);
    EXPECT_DOUBLE_EQ(calc("++1"), 1.0);
    EXPECT_DOUBLE_EQ(calc("+--1"), 1.0);
    EXPECT_DOUBLE_EQ(calc("-+--1"), -1.0);
    EXPECT_DOUBLE_EQ(calc("(-1)"), -1.0);
    EXPECT_DOUBLE_EQ(calc("1*-2"), -2.0);
    EXPECT_DOUBLE_EQ(calc("2^-3"), 0.125);
}

TEST(Calculator, SignRunsCollapse) {
    EXPECT_DOUBLE_EQ(calc("--+- 1 -- 1"), 0.0);
    EXPECT_DOUBLE_EQ(calc("1 - - 1"), 2.0);
    EXPECT_DOUBLE_EQ(calc("1 - - - 1"), 0.0);
}

TEST(Calculator, BinaryOperations) {
    EXPECT_DOUBLE_EQ(calc("1+1"), 2.0);
    EXPECT_DOUBLE_EQ(calc("1-2"), -1.0);
    EXPECT_DOUBLE_EQ(calc("2*2"), 4.0);
    EXPECT_DOUBLE_EQ(calc("4/5"), 0.8);
    EXPECT_DOUBLE_EQ(calc("5%4"), 1.0);
    EXPECT_DOUBLE_EQ(calc("5//4"), 1.0);
    EXPECT_DOUBLE_EQ(calc("2^4"), 16.0);
}

TEST(Calculator, Precedence) {
    EXPECT_DOUBLE_EQ(calc("2-3+4"), 3.0);
    EXPECT_DOUBLE_EQ(calc("2/3*4//5%6"), 0.0);
    EXPECT_DOUBLE_EQ(calc("2*3+4^5"), 1030.0);
}

TEST(Calculator, PowerIsRightAssociative) {
    EXPECT_DOUBLE_EQ(calc("2^3^4"), std::pow(2.0, std::pow(3.0, 4.0)));
    EXPECT_NE(calc("2^3^4"), std::pow(std::pow(2.0, 3.0), 4.0));
}

TEST(Calculator, Brackets) {
    EXPECT_DOUBLE_EQ(calc("(1)"), 1.0);
    EXPECT_DOUBLE_EQ(calc("2*(3+4)"), 14.0);
    EXPECT_DOUBLE_EQ(calc("(2-(3-(4+5)))"), 8.0);
    EXPECT_DOUBLE_EQ(calc("(((2+3)))"), 5.0);
}

TEST(Calculator, Constants) {
    EXPECT_DOUBLE_EQ(calc("pi+tau*e"), pi + tau * e);
    EXPECT_TRUE(std::isinf(calc("inf")));
}

TEST(Calculator, Functions) {
    EXPECT_DOUBLE_EQ(calc("sin(1)"), std::sin(1.0));
    EXPECT_EQ(calc("cos(sin(exp(3)))"), std::cos(std::sin(std::exp(3.0))));
    EXPECT_DOUBLE_EQ(calc("hypot(3, 4)"), 5.0);
    EXPECT_DOUBLE_EQ(calc("atan2(log10(123), expm1(4))"), std::atan2(std::log10(123.0), std::expm1(4.0)));
    EXPECT_DOUBLE_EQ(calc("log(cos(round(abs(-3456))))"), std::log(std::cos(3456.0)));
    EXPECT_DOUBLE_EQ(calc("gcd(12, 18, 27)"), 3.0);
    EXPECT_TRUE(truthy("isclose(1, 1, 2)"));
    EXPECT_TRUE(truthy("isclose(100, 101, 0.05)"));
}

TEST(Calculator, Comparison) {
    EXPECT_TRUE(truthy("1==1"));
    EXPECT_TRUE(truthy("1-2*3==1-2*3"));
    EXPECT_TRUE(truthy("2*4>1"));
    EXPECT_TRUE(truthy("3<log(4)*4"));
    EXPECT_TRUE(truthy("pi>=e"));
    EXPECT_TRUE(truthy("4>=4"));
    EXPECT_TRUE(truthy("3<=4"));
    EXPECT_TRUE(truthy("pi<=pi"));
    EXPECT_TRUE(truthy("4!=5-4"));
    EXPECT_FALSE(truthy("1==2"));
    EXPECT_FALSE(truthy("0>1"));
    EXPECT_FALSE(truthy("5<4"));
    EXPECT_FALSE(truthy("4>=5"));
    EXPECT_FALSE(truthy("5<=4"));
    EXPECT_FALSE(truthy("4!=4"));
    EXPECT_FALSE(truthy("2^-5==2"));
}

TEST(Calculator, ComparisonChainsAreLeftToRight) {
    // (3 > 2) > 1  ->  true > 1  ->  1 > 1
    EXPECT_FALSE(truthy("3>2>1"));
    EXPECT_TRUE(truthy("1<2<3"));
}

TEST(Calculator, BooleansAsOperands) {
    EXPECT_DOUBLE_EQ(calc("(1==1)+1"), 2.0);
    EXPECT_DOUBLE_EQ(calc("abs(2>1)"), 1.0);
}

TEST(Calculator, GeneralExpressions) {
    EXPECT_DOUBLE_EQ(calc(".123"), .123);
    EXPECT_DOUBLE_EQ(calc("pi*(12.34+.234)"), pi * (12.34 + .234));
    EXPECT_DOUBLE_EQ(calc("123-2+4%5"), 125.0);
    EXPECT_DOUBLE_EQ(calc("(1234*34567+1)^2"), std::pow(1234.0 * 34567.0 + 1.0, 2.0));
    EXPECT_DOUBLE_EQ(calc("--+-(234*e/pi+(3-2)^2)"), -(234 * e / pi + 1.0));
    EXPECT_DOUBLE_EQ(calc("12.345 - 12 + 9.0"), 12.345 - 12 + 9.0);
    EXPECT_DOUBLE_EQ(calc("cos(3^2)-hypot(tau, log(12))"), std::cos(9.0) - std::hypot(tau, std::log(12.0)));
    EXPECT_DOUBLE_EQ(calc("-+--23+--3.45*-e"), -23 + 3.45 * -e);
    EXPECT_DOUBLE_EQ(calc("5^0-45*(3.45-(-cos(4)/3))"), 1.0 - 45 * (3.45 - (-std::cos(4.0) / 3)));
}

TEST(Calculator, Errors) {
    EXPECT_EQ(failure(""), ErrorKind::EmptyExpression);
    EXPECT_EQ(failure("     "), ErrorKind::EmptyExpression);
    EXPECT_EQ(failure("1/0"), ErrorKind::OperationFailed);
    EXPECT_EQ(failure("(123"), ErrorKind::UnmatchedParenthesis);
    EXPECT_EQ(failure("1+(3*4"), ErrorKind::UnmatchedParenthesis);
    EXPECT_EQ(failure("abs()"), ErrorKind::InvalidArity);
    EXPECT_EQ(failure("hypot(2, 3, 4)"), ErrorKind::InvalidArity);
    EXPECT_EQ(failure("2**3"), ErrorKind::InvalidFinalResult);
    EXPECT_EQ(failure("qwerty"), ErrorKind::UnknownToken);
    EXPECT_EQ(failure("abs 3"), ErrorKind::MissingFunctionParen);
    EXPECT_EQ(failure("-++--"), ErrorKind::UnknownToken);
    EXPECT_EQ(failure("123-"), ErrorKind::UnknownToken);
    EXPECT_EQ(failure("pi.123"), ErrorKind::UnknownToken);
    EXPECT_EQ(failure("2=2"), ErrorKind::UnknownToken);
    EXPECT_EQ(failure("123=="), ErrorKind::InvalidFinalResult);
    EXPECT_EQ(failure("4 / / 3"), ErrorKind::InvalidFinalResult);
    EXPECT_EQ(failure("1+2 3"), ErrorKind::InvalidFinalResult);
    EXPECT_EQ(failure("sqrt(-1)"), ErrorKind::OperationFailed);
}

TEST(Calculator, ErrorKindNames) {
    EXPECT_STREQ(rpncalc::to_string(ErrorKind::EmptyExpression), "EmptyExpressionError");
    EXPECT_STREQ(rpncalc::to_string(ErrorKind::InvalidArity), "InvalidArityError");
}

TEST(Calculator, RepeatedEvaluationIsStable) {
    const std::string input = "cos(hypot(tau, log(12))) + 2^-5";
    const double first = calc(input);
    for (int i = 0; i < 10; ++i) EXPECT_EQ(calc(input), first);

    auto err1 = rpncalc::calculate("hypot(2, 3, 4)");
    auto err2 = rpncalc::calculate("hypot(2, 3, 4)");
    ASSERT_FALSE(err1.ok());
    ASSERT_FALSE(err2.ok());
    EXPECT_EQ(err1.error().message, err2.error().message);
}

TEST(Calculator, CustomRegistry) {
    rpncalc::Registry reg{
        rpncalc::ConstantTable{{"answer", 42.0}},
        rpncalc::FunctionTable{
            {"twice", {rpncalc::Arity::fixed(1),
                       [](const std::vector<double>& a) -> rpncalc::Result<rpncalc::Value> {
                           return rpncalc::Value{2.0 * a[0]};
                       }}},
        },
    };
    auto r = rpncalc::calculate("twice(answer) - 4", reg);
    ASSERT_TRUE(r.ok());
    EXPECT_DOUBLE_EQ(std::get<double>(r.value()), 80.0);

    auto unknown = rpncalc::calculate("pi", reg);
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error().kind, ErrorKind::UnknownToken);
}

TEST(Calculator, FormatValue) {
    using rpncalc::format_value;
    EXPECT_EQ(format_value(true), "True");
    EXPECT_EQ(format_value(false), "False");
    EXPECT_EQ(format_value(5.0), "5.0");
    EXPECT_EQ(format_value(-2.0), "-2.0");
    EXPECT_EQ(format_value(0.1), "0.1");
    EXPECT_EQ(format_value(0.8), "0.8");
    EXPECT_EQ(format_value(1e16), "1e+16");
    EXPECT_EQ(format_value(1.5e-05), "1.5e-05");
    EXPECT_EQ(format_value(std::numeric_limits<double>::infinity()), "inf");
    EXPECT_EQ(format_value(-std::numeric_limits<double>::infinity()), "-inf");
}

} // namespace
