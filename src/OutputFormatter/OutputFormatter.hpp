#pragma once

#include <string>

#include "../Arithmetic/Arithmetic.hpp"

namespace p101 {

/**
 * OutputFormatter
 *
 * Renders values the way the printing tape shows them: exactly
 * displayDigits decimals, zero padded, extra decimals truncated with the
 * same policy Register::write uses. With zero digits the value prints as
 * an integer.
 */
class OutputFormatter {
public:
    OutputFormatter() = default;

    std::string format(const Number& value, int displayDigits) const;

    // Unformatted canonical text, used for raw register read-outs
    std::string raw(const Number& value) const;

private:
    ArithmeticUnit alu_;
};

} // namespace p101
