#include "OutputFormatter.hpp"

#include <algorithm>

namespace p101 {

std::string OutputFormatter::format(const Number& value, int displayDigits) const {
    displayDigits = std::max(0, displayDigits);
    std::string text = alu_.toText(value);

    bool negative = !text.empty() && text[0] == '-';
    if (negative) text.erase(0, 1);

    std::string integerPart = text;
    std::string fraction;
    auto point = text.find('.');
    if (point != std::string::npos) {
        integerPart = text.substr(0, point);
        fraction = text.substr(point + 1);
    }

    if (fraction.size() > static_cast<size_t>(displayDigits)) {
        fraction.resize(displayDigits);
    } else {
        fraction.append(displayDigits - fraction.size(), '0');
    }

    std::string result = integerPart;
    if (displayDigits > 0) result += "." + fraction;

    // A value truncated to all zeros prints without a sign
    bool nonZero = std::any_of(result.begin(), result.end(),
                               [](char c) { return c >= '1' && c <= '9'; });
    if (negative && nonZero) result.insert(result.begin(), '-');
    return result;
}

std::string OutputFormatter::raw(const Number& value) const {
    return alu_.toText(value);
}

} // namespace p101
