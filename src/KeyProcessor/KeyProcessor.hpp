#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "../Arithmetic/Arithmetic.hpp"
#include "../Keyboard/Keyboard.hpp"
#include "../OutputFormatter/OutputFormatter.hpp"
#include "../Register/RegisterBank.hpp"
#include "../Runtime/P101Error.hpp"

namespace p101 {

// Result of a single key press
struct KeyOutcome {
    std::optional<std::string> display;   // line printed on the tape
    CalcError error{CalcError::None};
    bool awaitingDigits{false};           // SetDigits needs a count from the caller

    explicit operator bool() const { return error == CalcError::None; }
};

/**
 * KeyProcessor
 *
 * The dispatch state machine of the calculator. Each key is interpreted
 * against the previously pressed key: digits continue or start an entry in
 * M, the display/transfer/exchange keys act on the register selected by
 * the previous key, and the undo key rewinds that context by one step.
 *
 * The processor owns the register bank and all interpreter context.
 */
class KeyProcessor {
public:
    // Receives read-only access to all registers when the debug key is pressed
    using DebugCallback = std::function<void(const RegisterBank&)>;

    KeyProcessor() = default;

    KeyOutcome press(const Key& key);

    // Display digits (0..21); out-of-range counts leave the setting unchanged
    CalcError setDisplayDigits(int digits);
    int displayDigits() const { return displayDigits_; }

    const std::optional<Key>& previousKey() const { return previousKey_; }
    const std::optional<Key>& previousKeyBackup() const { return previousKeyBackup_; }

    RegisterBank& bank() { return bank_; }
    const RegisterBank& bank() const { return bank_; }

    void setDebugCallback(DebugCallback cb) { debug_ = std::move(cb); }

private:
    RegisterBank bank_;
    ArithmeticUnit alu_;
    OutputFormatter formatter_;

    std::optional<Key> previousKey_;
    std::optional<Key> previousKeyBackup_;
    int displayDigits_{0};
    DebugCallback debug_{};

    KeyOutcome dispatch(const Key& key);
    void updateContext(const Key& key);

    // Key handlers
    KeyOutcome enterDigit(char digit);
    KeyOutcome addOrSubtract(bool subtract);
    KeyOutcome multiply();
    KeyOutcome divide();
    KeyOutcome squareRoot();
    KeyOutcome display();
    KeyOutcome displayAndClear();
    KeyOutcome exchange();

    // Helpers
    bool previousIsEntry() const;                      // digit or comma
    bool previousSelects(const std::string& names) const;
    std::string formatted(const Number& value) const;
    static KeyOutcome fail(CalcError error);
};

} // namespace p101
