#include <catch2/catch_all.hpp>
#include "OutputFormatter.hpp"
#include "../Register/Register.hpp"

#include <vector>

using namespace p101;

TEST_CASE("OutputFormatter pads to the display digits", "[formatter]") {
    OutputFormatter fmt;

    REQUIRE(fmt.format(Integer{5}, 2) == "5.00");
    REQUIRE(fmt.format(Real{25, 1}, 3) == "2.500");
    REQUIRE(fmt.format(Integer{-12}, 1) == "-12.0");
}

TEST_CASE("OutputFormatter truncates extra decimals", "[formatter]") {
    OutputFormatter fmt;

    REQUIRE(fmt.format(Real{314159, 5}, 2) == "3.14");
    REQUIRE(fmt.format(Real{2999, 3}, 2) == "2.99");
    REQUIRE(fmt.format(Real{-1256, 3}, 1) == "-1.2");
    REQUIRE(fmt.format(Real{-1, 3}, 2) == "0.00");
}

TEST_CASE("OutputFormatter with zero digits prints an integer", "[formatter]") {
    OutputFormatter fmt;

    REQUIRE(fmt.format(Real{35, 1}, 0) == "3");
    REQUIRE(fmt.format(Integer{42}, 0) == "42");
    REQUIRE(fmt.format(Real{-79, 1}, 0) == "-7");
}

TEST_CASE("OutputFormatter agrees with what the register stores", "[formatter]") {
    OutputFormatter fmt;
    ArithmeticUnit alu;
    Register reg;

    std::vector<Number> values{alu.divide(Integer{1}, Integer{3}).value,
                               alu.divide(Integer{-2}, Integer{3}).value,
                               Real{-5125, 3}, Real{100, 0}};
    for (const Number& v : values) {
        REQUIRE(reg.write(v, 2) == CalcError::None);
        REQUIRE(fmt.format(reg.read(), 2) == fmt.format(v, 2));
    }
}

TEST_CASE("OutputFormatter shows every computed decimal", "[formatter]") {
    OutputFormatter fmt;
    ArithmeticUnit alu;

    auto third = alu.divide(Integer{1}, Integer{3});
    REQUIRE(fmt.format(third.value, 21) == "0." + std::string(21, '3'));

    auto quotient = alu.divide(*alu.parseNumber("99999999999999999999"), Integer{3});
    REQUIRE(fmt.format(quotient.value, 5) == "33333333333333333333.00000");
}

TEST_CASE("OutputFormatter raw text", "[formatter]") {
    OutputFormatter fmt;

    REQUIRE(fmt.raw(Integer{7}) == "7");
    REQUIRE(fmt.raw(Real{25, 2}) == "0.25");
}
