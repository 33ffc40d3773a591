#pragma once

#include <optional>
#include <string>
#include <variant>

#include "../Runtime/P101Error.hpp"

namespace p101 {

// 128-bit integer: a full register (22 digits) plus headroom for sums
using WideInt = __int128;

// Fraction digits produced by divide and square root; one more than any
// register or display keeps, so later truncation stays exact
constexpr int kFractionDigits = 22;

// Longest Real mantissa; longer results lose decimals first, then overflow
constexpr int kMantissaDigits = 37;

// Values held by the registers
struct Integer { WideInt v{}; };  // register without decimal point

// Register with an active decimal point: mantissa / 10^scale
struct Real {
    WideInt mantissa{};
    int scale{};
};

using Number = std::variant<Integer, Real>;

/**
 * ArithmeticUnit
 *
 * Performs the operations behind the operator keys in exact decimal.
 * Two Integer operands stay Integer; any Real operand promotes the result
 * to Real. Division and square root always produce Real, truncated (never
 * rounded) after kFractionDigits decimals.
 */
class ArithmeticUnit {
public:
    ArithmeticUnit() = default;

    // Basic arithmetic operations
    CalcResult<Number> add(const Number& a, const Number& b) const;
    CalcResult<Number> subtract(const Number& a, const Number& b) const;
    CalcResult<Number> multiply(const Number& a, const Number& b) const;
    CalcResult<Number> divide(const Number& a, const Number& b) const;
    CalcResult<Number> modulo(const Number& a, const Number& b) const; // floored, sign of divisor

    // Unary operations
    CalcResult<Number> sqrt(const Number& a) const;
    CalcResult<Number> abs(const Number& a) const;

    bool isZero(const Number& a) const;

    // Canonical text: "-123" for Integer, fixed decimal with a '.' and no
    // trailing zeros beyond the first decimal for Real
    std::string toText(const Number& a) const;
    std::optional<Number> parseNumber(const std::string& text) const;
};

// Decimal text of a 128-bit integer
std::string wideToString(WideInt value);

} // namespace p101
