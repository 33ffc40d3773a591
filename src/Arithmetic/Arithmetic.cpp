#include "Arithmetic.hpp"

#include <algorithm>
#include <cctype>
#include <type_traits>
#include <vector>

namespace p101 {

namespace {

template<typename T>
constexpr bool isInteger = std::is_same_v<std::decay_t<T>, Integer>;

// Magnitude in decimal digits, least significant first, no leading zeros
using Digits = std::vector<int>;

// Signed exact decimal: digits / 10^scale
struct Decimal {
    Digits digits;
    int scale{0};
    bool negative{false};
};

void trim(Digits& d) {
    while (!d.empty() && d.back() == 0) d.pop_back();
}

// d = d * 10 + digit
void pushLow(Digits& d, int digit) {
    d.insert(d.begin(), digit);
    trim(d);
}

Digits shifted(const Digits& d, int places) {
    if (d.empty() || places <= 0) return d;
    Digits result(static_cast<size_t>(places), 0);
    result.insert(result.end(), d.begin(), d.end());
    return result;
}

int compareMagnitude(const Digits& a, const Digits& b) {
    if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
    for (size_t i = a.size(); i-- > 0;) {
        if (a[i] != b[i]) return a[i] < b[i] ? -1 : 1;
    }
    return 0;
}

Digits addMagnitude(const Digits& a, const Digits& b) {
    Digits result;
    int carry = 0;
    for (size_t i = 0; i < std::max(a.size(), b.size()) || carry; ++i) {
        int sum = carry + (i < a.size() ? a[i] : 0) + (i < b.size() ? b[i] : 0);
        result.push_back(sum % 10);
        carry = sum / 10;
    }
    trim(result);
    return result;
}

// Requires a >= b
Digits subtractMagnitude(const Digits& a, const Digits& b) {
    Digits result(a);
    int borrow = 0;
    for (size_t i = 0; i < result.size(); ++i) {
        int diff = result[i] - borrow - (i < b.size() ? b[i] : 0);
        borrow = diff < 0 ? 1 : 0;
        result[i] = diff + borrow * 10;
    }
    trim(result);
    return result;
}

Digits multiplyMagnitude(const Digits& a, const Digits& b) {
    if (a.empty() || b.empty()) return {};
    Digits result(a.size() + b.size(), 0);
    for (size_t i = 0; i < a.size(); ++i) {
        int carry = 0;
        for (size_t j = 0; j < b.size(); ++j) {
            int cur = result[i + j] + a[i] * b[j] + carry;
            result[i + j] = cur % 10;
            carry = cur / 10;
        }
        result[i + b.size()] += carry;
    }
    trim(result);
    return result;
}

// Schoolbook long division; the quotient is truncated
Digits divideMagnitude(const Digits& num, const Digits& den, Digits* remainder = nullptr) {
    Digits quotient(num.size(), 0);
    Digits rem;
    for (size_t i = num.size(); i-- > 0;) {
        pushLow(rem, num[i]);
        int q = 0;
        while (compareMagnitude(rem, den) >= 0) {
            rem = subtractMagnitude(rem, den);
            ++q;
        }
        quotient[i] = q;
    }
    trim(quotient);
    if (remainder) *remainder = rem;
    return quotient;
}

// floor(sqrt(n)), one root digit per pair of input digits
Digits sqrtMagnitude(const Digits& n) {
    Digits root;
    Digits rem;
    for (size_t pair = (n.size() + 1) / 2; pair-- > 0;) {
        size_t lo = pair * 2;
        pushLow(rem, lo + 1 < n.size() ? n[lo + 1] : 0);
        pushLow(rem, n[lo]);

        // Largest x with (20 * root + x) * x <= rem
        Digits twentyRoot = multiplyMagnitude(root, Digits{0, 2});
        Digits product;
        int x = 9;
        for (; x > 0; --x) {
            product = multiplyMagnitude(addMagnitude(twentyRoot, Digits{x}), Digits{x});
            if (compareMagnitude(product, rem) <= 0) break;
        }
        if (x > 0) rem = subtractMagnitude(rem, product);
        pushLow(root, x);
    }
    return root;
}

Decimal toDecimal(const Number& n) {
    WideInt value = 0;
    int scale = 0;
    std::visit([&value, &scale](auto&& x) {
        if constexpr (isInteger<decltype(x)>) {
            value = x.v;
        } else {
            value = x.mantissa;
            scale = x.scale;
        }
    }, n);

    Decimal d;
    d.negative = value < 0;
    d.scale = scale;
    unsigned __int128 magnitude = d.negative ? -static_cast<unsigned __int128>(value)
                                             : static_cast<unsigned __int128>(value);
    while (magnitude != 0) {
        d.digits.push_back(static_cast<int>(magnitude % 10));
        magnitude /= 10;
    }
    return d;
}

// Truncates decimals until the mantissa fits, then drops trailing zeros
CalcResult<Number> toReal(Decimal d) {
    trim(d.digits);
    while (d.digits.size() > static_cast<size_t>(kMantissaDigits) && d.scale > 0) {
        d.digits.erase(d.digits.begin());
        --d.scale;
    }
    if (d.digits.size() > static_cast<size_t>(kMantissaDigits)) {
        return {Number{Real{}}, CalcError::RegisterOverflow};
    }
    while (d.scale > 0 && !d.digits.empty() && d.digits.front() == 0) {
        d.digits.erase(d.digits.begin());
        --d.scale;
    }
    if (d.digits.empty()) d.scale = 0;

    WideInt mantissa = 0;
    for (size_t i = d.digits.size(); i-- > 0;) {
        mantissa = mantissa * 10 + d.digits[i];
    }
    return {Number{Real{d.negative ? -mantissa : mantissa, d.scale}}, CalcError::None};
}

void align(Decimal& a, Decimal& b) {
    if (a.scale < b.scale) {
        a.digits = shifted(a.digits, b.scale - a.scale);
        a.scale = b.scale;
    } else if (b.scale < a.scale) {
        b.digits = shifted(b.digits, a.scale - b.scale);
        b.scale = a.scale;
    }
}

Decimal addDecimal(Decimal a, Decimal b) {
    align(a, b);
    Decimal result;
    result.scale = a.scale;
    if (a.negative == b.negative) {
        result.digits = addMagnitude(a.digits, b.digits);
        result.negative = a.negative;
    } else if (compareMagnitude(a.digits, b.digits) >= 0) {
        result.digits = subtractMagnitude(a.digits, b.digits);
        result.negative = a.negative;
    } else {
        result.digits = subtractMagnitude(b.digits, a.digits);
        result.negative = b.negative;
    }
    return result;
}

} // namespace

std::string wideToString(WideInt value) {
    if (value == 0) return "0";
    bool negative = value < 0;
    unsigned __int128 magnitude = negative ? -static_cast<unsigned __int128>(value)
                                           : static_cast<unsigned __int128>(value);
    std::string digits;
    while (magnitude != 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(magnitude % 10)));
        magnitude /= 10;
    }
    if (negative) digits.push_back('-');
    std::reverse(digits.begin(), digits.end());
    return digits;
}

// Basic arithmetic operations
CalcResult<Number> ArithmeticUnit::add(const Number& a, const Number& b) const {
    return std::visit([&a, &b]([[maybe_unused]] auto&& x, [[maybe_unused]] auto&& y) -> CalcResult<Number> {
        if constexpr (isInteger<decltype(x)> && isInteger<decltype(y)>) {
            WideInt result{};
            if (__builtin_add_overflow(x.v, y.v, &result)) {
                return {Number{Integer{}}, CalcError::RegisterOverflow};
            }
            return {Number{Integer{result}}, CalcError::None};
        } else {
            return toReal(addDecimal(toDecimal(a), toDecimal(b)));
        }
    }, a, b);
}

CalcResult<Number> ArithmeticUnit::subtract(const Number& a, const Number& b) const {
    return std::visit([&a, &b]([[maybe_unused]] auto&& x, [[maybe_unused]] auto&& y) -> CalcResult<Number> {
        if constexpr (isInteger<decltype(x)> && isInteger<decltype(y)>) {
            WideInt result{};
            if (__builtin_sub_overflow(x.v, y.v, &result)) {
                return {Number{Integer{}}, CalcError::RegisterOverflow};
            }
            return {Number{Integer{result}}, CalcError::None};
        } else {
            Decimal negated = toDecimal(b);
            negated.negative = !negated.negative;
            return toReal(addDecimal(toDecimal(a), negated));
        }
    }, a, b);
}

CalcResult<Number> ArithmeticUnit::multiply(const Number& a, const Number& b) const {
    return std::visit([&a, &b]([[maybe_unused]] auto&& x, [[maybe_unused]] auto&& y) -> CalcResult<Number> {
        if constexpr (isInteger<decltype(x)> && isInteger<decltype(y)>) {
            WideInt result{};
            if (__builtin_mul_overflow(x.v, y.v, &result)) {
                return {Number{Integer{}}, CalcError::RegisterOverflow};
            }
            return {Number{Integer{result}}, CalcError::None};
        } else {
            Decimal da = toDecimal(a);
            Decimal db = toDecimal(b);
            Decimal product;
            product.digits = multiplyMagnitude(da.digits, db.digits);
            product.scale = da.scale + db.scale;
            product.negative = da.negative != db.negative;
            return toReal(product);
        }
    }, a, b);
}

CalcResult<Number> ArithmeticUnit::divide(const Number& a, const Number& b) const {
    // Check for division by zero first
    if (isZero(b)) {
        return {Number{Real{}}, CalcError::DivisionByZero};
    }

    // (ma / 10^sa) / (mb / 10^sb) with kFractionDigits decimals
    Decimal da = toDecimal(a);
    Decimal db = toDecimal(b);
    Decimal quotient;
    quotient.digits = divideMagnitude(shifted(da.digits, db.scale + kFractionDigits),
                                      shifted(db.digits, da.scale));
    quotient.scale = kFractionDigits;
    quotient.negative = da.negative != db.negative;
    return toReal(quotient);
}

CalcResult<Number> ArithmeticUnit::modulo(const Number& a, const Number& b) const {
    if (isZero(b)) {
        return {Number{Integer{}}, CalcError::DivisionByZero};
    }

    return std::visit([&a, &b]([[maybe_unused]] auto&& x, [[maybe_unused]] auto&& y) -> CalcResult<Number> {
        if constexpr (isInteger<decltype(x)> && isInteger<decltype(y)>) {
            WideInt result = x.v % y.v;
            if (result != 0 && ((result < 0) != (y.v < 0))) result += y.v;
            return {Number{Integer{result}}, CalcError::None};
        } else {
            Decimal da = toDecimal(a);
            Decimal db = toDecimal(b);
            align(da, db);

            Decimal rem;
            divideMagnitude(da.digits, db.digits, &rem.digits);
            rem.scale = da.scale;
            if (!rem.digits.empty() && da.negative != db.negative) {
                rem.digits = subtractMagnitude(db.digits, rem.digits);
            }
            rem.negative = db.negative;
            return toReal(rem);
        }
    }, a, b);
}

// Unary operations
CalcResult<Number> ArithmeticUnit::sqrt(const Number& a) const {
    Decimal da = toDecimal(a);
    if (da.negative) {
        return {Number{Real{}}, CalcError::NegativeSqrtOperand};
    }

    // sqrt(m / 10^s) * 10^F == sqrt(m * 10^(2F - s))
    int fraction = std::max(kFractionDigits, (da.scale + 1) / 2);
    Decimal root;
    root.digits = sqrtMagnitude(shifted(da.digits, 2 * fraction - da.scale));
    root.scale = fraction;
    return toReal(root);
}

CalcResult<Number> ArithmeticUnit::abs(const Number& a) const {
    return std::visit([](auto&& x) -> CalcResult<Number> {
        if constexpr (isInteger<decltype(x)>) {
            return {Number{Integer{x.v < 0 ? -x.v : x.v}}, CalcError::None};
        } else {
            return {Number{Real{x.mantissa < 0 ? -x.mantissa : x.mantissa, x.scale}}, CalcError::None};
        }
    }, a);
}

bool ArithmeticUnit::isZero(const Number& a) const {
    return std::visit([](auto&& x) -> bool {
        if constexpr (isInteger<decltype(x)>) {
            return x.v == 0;
        } else {
            return x.mantissa == 0;
        }
    }, a);
}

std::string ArithmeticUnit::toText(const Number& a) const {
    return std::visit([](auto&& x) -> std::string {
        if constexpr (isInteger<decltype(x)>) {
            return wideToString(x.v);
        } else {
            bool negative = x.mantissa < 0;
            std::string digits = wideToString(negative ? -x.mantissa : x.mantissa);
            size_t scale = static_cast<size_t>(std::max(0, x.scale));
            if (digits.size() <= scale) digits.insert(0, scale + 1 - digits.size(), '0');

            std::string integerPart = digits.substr(0, digits.size() - scale);
            std::string fraction = digits.substr(digits.size() - scale);
            while (fraction.size() > 1 && fraction.back() == '0') fraction.pop_back();
            if (fraction.empty()) fraction = "0";
            return (negative ? "-" : "") + integerPart + "." + fraction;
        }
    }, a);
}

std::optional<Number> ArithmeticUnit::parseNumber(const std::string& text) const {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    if (begin == end) return std::nullopt;

    bool negative = false;
    if (text[begin] == '-' || text[begin] == '+') {
        negative = text[begin] == '-';
        ++begin;
    }

    WideInt value = 0;
    int digitCount = 0;
    int scale = 0;
    bool point = false;
    for (size_t i = begin; i < end; ++i) {
        char c = text[i];
        if (c == '.') {
            if (point) return std::nullopt;
            point = true;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            if (__builtin_mul_overflow(value, WideInt{10}, &value) ||
                __builtin_add_overflow(value, WideInt{c - '0'}, &value)) {
                return std::nullopt;
            }
            ++digitCount;
            if (point) ++scale;
        } else {
            return std::nullopt;
        }
    }
    if (digitCount == 0) return std::nullopt;

    if (negative) value = -value;
    if (point) return Number{Real{value, scale}};
    return Number{Integer{value}};
}

} // namespace p101
