#include <catch2/catch_all.hpp>
#include "Arithmetic.hpp"

using namespace p101;

static Number num(const char* text) {
    auto value = ArithmeticUnit{}.parseNumber(text);
    REQUIRE(value.has_value());
    return *value;
}

TEST_CASE("ArithmeticUnit integer arithmetic stays exact", "[arithmetic]") {
    ArithmeticUnit alu;

    SECTION("Integer addition") {
        auto result = alu.add(Integer{5}, Integer{3});
        REQUIRE(result);
        REQUIRE(std::holds_alternative<Integer>(result.value));
        REQUIRE(alu.toText(result.value) == "8");
    }

    SECTION("Integer subtraction can go negative") {
        auto result = alu.subtract(Integer{3}, Integer{8});
        REQUIRE(result);
        REQUIRE(alu.toText(result.value) == "-5");
    }

    SECTION("22-digit operands multiply exactly") {
        auto result = alu.multiply(num("1234567890123456789012"), Integer{10});
        REQUIRE(result);
        REQUIRE(alu.toText(result.value) == "12345678901234567890120");
    }

    SECTION("Product beyond 128 bits reports overflow") {
        auto nines = num("9999999999999999999999");
        auto result = alu.multiply(nines, nines);
        REQUIRE_FALSE(result);
        REQUIRE(result.error == CalcError::RegisterOverflow);
    }
}

TEST_CASE("ArithmeticUnit decimal arithmetic is exact", "[arithmetic]") {
    ArithmeticUnit alu;

    SECTION("Mixed addition promotes to Real") {
        auto result = alu.add(Integer{1}, Real{5, 1});
        REQUIRE(result);
        REQUIRE(std::holds_alternative<Real>(result.value));
        REQUIRE(alu.toText(result.value) == "1.5");
    }

    SECTION("Tenths add without binary error") {
        REQUIRE(alu.toText(alu.add(num("0.1"), num("0.2")).value) == "0.3");
        REQUIRE(alu.toText(alu.add(num("0.7"), num("0.1")).value) == "0.8");
        REQUIRE(alu.toText(alu.subtract(num("1.1"), num("0.3")).value) == "0.8");
    }

    SECTION("Scales are aligned before adding") {
        REQUIRE(alu.toText(alu.add(num("12.5"), num("0.005")).value) == "12.505");

        // Decimals beyond the mantissa width are truncated, never rounded
        auto result = alu.add(num("1234567890123456789012"), num("0.000000000000000000001"));
        REQUIRE(result);
        REQUIRE(alu.toText(result.value) == "1234567890123456789012.0");
    }

    SECTION("Decimal product keeps every digit") {
        REQUIRE(alu.toText(alu.multiply(num("1.234"), Integer{2}).value) == "2.468");
        REQUIRE(alu.toText(alu.multiply(num("-0.5"), num("0.25")).value) == "-0.125");
    }

    SECTION("Product of two full registers keeps the leading digits") {
        // (10^11 - 10^-11)^2 == 10^22 - 2 + 10^-22
        auto result = alu.multiply(num("99999999999.99999999999"), num("99999999999.99999999999"));
        REQUIRE(result);
        REQUIRE(alu.toText(result.value) == "9999999999999999999998.0");
    }
}

TEST_CASE("ArithmeticUnit division", "[arithmetic]") {
    ArithmeticUnit alu;

    SECTION("Division is always real") {
        auto result = alu.divide(Integer{6}, Integer{3});
        REQUIRE(result);
        REQUIRE(std::holds_alternative<Real>(result.value));
        REQUIRE(alu.toText(result.value) == "2.0");
    }

    SECTION("Twenty integer digits divide exactly") {
        auto result = alu.divide(num("99999999999999999999"), Integer{3});
        REQUIRE(result);
        REQUIRE(alu.toText(result.value) == "33333333333333333333.0");
    }

    SECTION("Quotient is truncated after the fraction digits") {
        auto third = alu.divide(Integer{1}, Integer{3});
        REQUIRE(alu.toText(third.value) == "0." + std::string(kFractionDigits, '3'));

        auto twoThirds = alu.divide(Integer{-2}, Integer{3});
        REQUIRE(alu.toText(twoThirds.value) == "-0." + std::string(kFractionDigits, '6'));
    }

    SECTION("Decimal operands") {
        REQUIRE(alu.toText(alu.divide(num("7.5"), num("0.25")).value) == "30.0");
        REQUIRE(alu.toText(alu.divide(num("0.01"), Integer{4}).value) == "0.0025");
    }

    SECTION("Division by zero") {
        auto result = alu.divide(Integer{5}, Integer{0});
        REQUIRE_FALSE(result);
        REQUIRE(result.error == CalcError::DivisionByZero);
        REQUIRE(alu.divide(Integer{5}, Real{0, 3}).error == CalcError::DivisionByZero);
    }
}

TEST_CASE("ArithmeticUnit square root", "[arithmetic]") {
    ArithmeticUnit alu;

    SECTION("Perfect square") {
        auto result = alu.sqrt(Integer{16});
        REQUIRE(result);
        REQUIRE(std::holds_alternative<Real>(result.value));
        REQUIRE(alu.toText(result.value) == "4.0");
    }

    SECTION("Irrational root is truncated digit by digit") {
        REQUIRE(alu.toText(alu.sqrt(Integer{2}).value) == "1.4142135623730950488016");
        REQUIRE(alu.toText(alu.sqrt(num("0.0144")).value) == "0.12");
    }

    SECTION("Zero") {
        REQUIRE(alu.isZero(alu.sqrt(Integer{0}).value));
    }

    SECTION("Square root of negative number") {
        auto result = alu.sqrt(Integer{-9});
        REQUIRE_FALSE(result);
        REQUIRE(result.error == CalcError::NegativeSqrtOperand);
    }
}

TEST_CASE("ArithmeticUnit modulo takes the sign of the divisor", "[arithmetic]") {
    ArithmeticUnit alu;

    REQUIRE(alu.toText(alu.modulo(Integer{7}, Integer{2}).value) == "1");
    REQUIRE(alu.toText(alu.modulo(Integer{-7}, Integer{2}).value) == "1");
    REQUIRE(alu.toText(alu.modulo(Integer{7}, Integer{-2}).value) == "-1");

    auto real = alu.modulo(num("7.5"), Integer{2});
    REQUIRE(real);
    REQUIRE(alu.toText(real.value) == "1.5");
    REQUIRE(alu.toText(alu.modulo(num("-7.5"), Integer{2}).value) == "0.5");
    REQUIRE(alu.toText(alu.modulo(num("7.5"), Integer{-2}).value) == "-0.5");

    REQUIRE(alu.modulo(Integer{1}, Integer{0}).error == CalcError::DivisionByZero);
}

TEST_CASE("ArithmeticUnit absolute value keeps the kind", "[arithmetic]") {
    ArithmeticUnit alu;

    auto i = alu.abs(Integer{-42});
    REQUIRE(std::holds_alternative<Integer>(i.value));
    REQUIRE(alu.toText(i.value) == "42");

    auto r = alu.abs(Real{-25, 1});
    REQUIRE(std::holds_alternative<Real>(r.value));
    REQUIRE(alu.toText(r.value) == "2.5");
}

TEST_CASE("ArithmeticUnit canonical text", "[arithmetic]") {
    ArithmeticUnit alu;

    SECTION("Reals always carry a decimal point") {
        REQUIRE(alu.toText(Real{3, 0}) == "3.0");
        REQUIRE(alu.toText(Real{1, 1}) == "0.1");
        REQUIRE(alu.toText(Real{-25, 1}) == "-2.5");
        REQUIRE(alu.toText(Real{5, 3}) == "0.005");
    }

    SECTION("Trailing zeros after the first decimal are dropped") {
        REQUIRE(alu.toText(Real{150, 2}) == "1.5");
        REQUIRE(alu.toText(Real{0, 4}) == "0.0");
    }

    SECTION("Large reals use fixed notation") {
        REQUIRE(alu.toText(num("10000000000000000000000.0")) == "10000000000000000000000.0");
    }

    SECTION("Integers") {
        REQUIRE(alu.toText(Integer{0}) == "0");
        REQUIRE(alu.toText(Integer{-1234}) == "-1234");
    }
}

TEST_CASE("ArithmeticUnit parses canonical text", "[arithmetic]") {
    ArithmeticUnit alu;

    auto i = alu.parseNumber(" -120 ");
    REQUIRE(i.has_value());
    REQUIRE(std::holds_alternative<Integer>(*i));
    REQUIRE(alu.toText(*i) == "-120");

    auto r = alu.parseNumber("3.25");
    REQUIRE(r.has_value());
    REQUIRE(std::holds_alternative<Real>(*r));
    REQUIRE(std::get<Real>(*r).scale == 2);
    REQUIRE(alu.toText(*r) == "3.25");

    REQUIRE_FALSE(alu.parseNumber("").has_value());
    REQUIRE_FALSE(alu.parseNumber("-").has_value());
    REQUIRE_FALSE(alu.parseNumber("1.2.3").has_value());
    REQUIRE_FALSE(alu.parseNumber("12a").has_value());
}
