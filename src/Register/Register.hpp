#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "../Arithmetic/Arithmetic.hpp"
#include "../Runtime/P101Error.hpp"

namespace p101 {

/**
 * Register
 *
 * Fixed-capacity decimal store of the desk calculator: 22 BCD digits
 * (index 0 = units, index 21 = most significant), the count of digits
 * that lie after the decimal point, and a sign.
 */
class Register {
public:
    static constexpr int kDigits = 22;
    static constexpr int kMaxFloatPosition = kDigits - 1;

    enum class Sign { Positive, Negative };

    Register() = default;

    // Digit entry
    void shift();
    void erase();
    bool isFull() const;

    // Conversion to and from values
    Number read() const;
    CalcError write(const Number& value, int fractionDigits);
    CalcError writeFitting(const Number& value);   // keeps as many decimals as fit

    // Raw access
    int digit(int index) const { return digits_[index]; }
    void setDigit(int index, int value) { digits_[index] = static_cast<uint8_t>(value); }
    int floatPosition() const { return floatPosition_; }
    bool floatActive() const { return floatActive_; }
    void setFloatActive(bool active) { floatActive_ = active; }
    Sign sign() const { return sign_; }
    void setSign(Sign sign) { sign_ = sign; }

    // Debug rendering: digits most significant first, then metadata
    std::string describe() const;

private:
    std::array<uint8_t, kDigits> digits_{};
    int floatPosition_{0};
    bool floatActive_{false};
    Sign sign_{Sign::Positive};

    // maxFraction < 0 means "truncate only as far as capacity requires"
    CalcError writeText(std::string text, int maxFraction);
};

} // namespace p101
