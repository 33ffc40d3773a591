#include <catch2/catch_all.hpp>
#include "../src/KeyProcessor/KeyProcessor.hpp"
#include "../src/Keyboard/Keyboard.hpp"

using namespace p101;

static Key keyOf(const std::string& token) {
    static const Keyboard kb;
    auto decoded = kb.decode(token);
    REQUIRE(decoded.has_value());
    return *decoded;
}

static std::string textOf(const KeyProcessor& proc, char name) {
    return ArithmeticUnit{}.toText(proc.bank().get(name).read());
}

TEST_CASE("Context starts empty", "[context]") {
    KeyProcessor proc;
    REQUIRE_FALSE(proc.previousKey().has_value());
    REQUIRE_FALSE(proc.previousKeyBackup().has_value());
    REQUIRE(proc.displayDigits() == 0);
}

TEST_CASE("Backup trails the previous key by one step", "[context]") {
    KeyProcessor proc;

    proc.press(keyOf("4"));
    REQUIRE(proc.previousKey() == keyOf("4"));
    REQUIRE_FALSE(proc.previousKeyBackup().has_value());

    proc.press(keyOf("+"));
    REQUIRE(proc.previousKey() == keyOf("+"));
    REQUIRE(proc.previousKeyBackup() == keyOf("4"));

    proc.press(keyOf("B"));
    REQUIRE(proc.previousKey() == keyOf("B"));
    REQUIRE(proc.previousKeyBackup() == keyOf("+"));
}

TEST_CASE("Comma outside digit entry is a true no-op", "[context]") {
    KeyProcessor proc;

    SECTION("After clear-all") {
        proc.press(keyOf("5"));
        proc.press(keyOf("r"));
        auto outcome = proc.press(keyOf(","));
        REQUIRE(outcome);
        REQUIRE(proc.previousKey() == keyOf("r"));
        REQUIRE(proc.previousKeyBackup() == keyOf("5"));
        REQUIRE_FALSE(proc.bank().get('M').floatActive());
    }

    SECTION("Entry resumes after a display and a stray comma") {
        proc.press(keyOf("3"));
        proc.press(keyOf("◊"));
        proc.press(keyOf(","));
        proc.press(keyOf("8"));
        REQUIRE(textOf(proc, 'M') == "8");
        REQUIRE_FALSE(proc.bank().get('M').floatActive());
    }

    SECTION("A second comma is ignored") {
        proc.press(keyOf("1"));
        proc.press(keyOf(","));
        proc.press(keyOf(","));
        REQUIRE(proc.previousKey() == keyOf(","));
        proc.press(keyOf("5"));
        REQUIRE(textOf(proc, 'M') == "1.5");
    }
}

TEST_CASE("Undo rewinds context but not registers", "[context]") {
    KeyProcessor proc;

    proc.press(keyOf("1"));
    proc.press(keyOf("+"));
    REQUIRE(textOf(proc, 'A') == "1");

    proc.press(keyOf("u"));
    REQUIRE(proc.previousKey() == keyOf("1"));

    // The next digit continues the entry as if '+' never happened
    proc.press(keyOf("2"));
    REQUIRE(textOf(proc, 'M') == "12");
    REQUIRE(textOf(proc, 'A') == "1");
}

TEST_CASE("Repeated undo is idempotent", "[context]") {
    KeyProcessor proc;

    proc.press(keyOf("C"));
    proc.press(keyOf("7"));
    proc.press(keyOf("u"));
    proc.press(keyOf("u"));
    proc.press(keyOf("u"));
    REQUIRE(proc.previousKey() == keyOf("C"));
    REQUIRE(proc.previousKeyBackup() == keyOf("C"));

    // Context says C is selected, so transfer up stores M in C
    proc.press(keyOf("↑"));
    REQUIRE(textOf(proc, 'C') == "7");
}

TEST_CASE("Undo before any key leaves the context empty", "[context]") {
    KeyProcessor proc;
    proc.press(keyOf("u"));
    REQUIRE_FALSE(proc.previousKey().has_value());
}

TEST_CASE("Selectors only set context", "[context]") {
    KeyProcessor proc;
    proc.press(keyOf("4"));
    proc.press(keyOf("D"));
    REQUIRE(textOf(proc, 'M') == "4");
    REQUIRE(textOf(proc, 'D') == "0");
    REQUIRE(proc.previousKey() == keyOf("D"));

    // A digit after a selector starts a new entry
    proc.press(keyOf("6"));
    REQUIRE(textOf(proc, 'M') == "6");
}
