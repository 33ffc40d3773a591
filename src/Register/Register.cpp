#include "Register.hpp"

#include <algorithm>
#include <sstream>

namespace p101 {

void Register::shift() {
    for (int i = kDigits - 1; i > 0; --i) {
        digits_[i] = digits_[i - 1];
    }
    digits_[0] = 0;
    if (floatActive_) ++floatPosition_;
}

void Register::erase() {
    digits_.fill(0);
    floatPosition_ = 0;
    floatActive_ = false;
    sign_ = Sign::Positive;
}

bool Register::isFull() const {
    return !(digits_[kDigits - 1] == 0 && floatPosition_ != kMaxFloatPosition);
}

Number Register::read() const {
    WideInt value = 0;
    for (int i = kDigits - 1; i >= 0; --i) {
        value = value * 10 + digits_[i];
    }
    if (sign_ == Sign::Negative) value = -value;

    if (!floatActive_) return Integer{value};
    return Real{value, floatPosition_};
}

CalcError Register::write(const Number& value, int fractionDigits) {
    return writeText(ArithmeticUnit{}.toText(value), std::max(0, fractionDigits));
}

CalcError Register::writeFitting(const Number& value) {
    return writeText(ArithmeticUnit{}.toText(value), -1);
}

CalcError Register::writeText(std::string text, int maxFraction) {
    Register staged;

    bool negative = !text.empty() && text[0] == '-';
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) text.erase(0, 1);

    auto point = text.find('.');
    if (point != std::string::npos) {
        int fraction = static_cast<int>(text.size() - point - 1);
        int limit = maxFraction >= 0 ? maxFraction
                                     : std::max(0, kDigits - static_cast<int>(point));
        if (fraction > limit) {
            text.resize(point + 1 + limit);  // truncate, never round
            fraction = limit;
        }
        staged.floatActive_ = true;
        staged.floatPosition_ = fraction;
        text.erase(point, 1);
    }

    if (text.size() > static_cast<size_t>(kDigits) || staged.floatPosition_ > kMaxFloatPosition) {
        return CalcError::RegisterOverflow;
    }

    bool nonZero = false;
    for (size_t i = 0; i < text.size(); ++i) {
        int d = text[text.size() - 1 - i] - '0';
        staged.digits_[i] = static_cast<uint8_t>(d);
        nonZero = nonZero || d != 0;
    }
    staged.sign_ = (negative && nonZero) ? Sign::Negative : Sign::Positive;

    *this = staged;
    return CalcError::None;
}

std::string Register::describe() const {
    std::ostringstream oss;
    oss << '[';
    for (int i = kDigits - 1; i >= 0; --i) {
        oss << static_cast<int>(digits_[i]);
    }
    oss << "] fp=" << floatPosition_
        << " float=" << (floatActive_ ? "on" : "off")
        << " sign=" << (sign_ == Sign::Negative ? '-' : '+');
    return oss.str();
}

} // namespace p101
