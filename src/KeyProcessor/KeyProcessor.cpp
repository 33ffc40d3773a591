#include "KeyProcessor.hpp"

#include <string>
#include <utility>

namespace p101 {

namespace {

constexpr const char* kStorageRegisters = "BCDEF";
constexpr const char* kReadableRegisters = "ARBCDEF";

} // namespace

KeyOutcome KeyProcessor::press(const Key& key) {
    // Undo rewinds the context and is not itself remembered
    if (key.code == KeyCode::Undo) {
        previousKey_ = previousKeyBackup_;
        return {};
    }

    // A comma outside digit entry is ignored and leaves the context alone
    if (key.code == KeyCode::Comma && !(previousKey_ && previousKey_->isDigit())) {
        return {};
    }

    KeyOutcome outcome;
    try {
        outcome = dispatch(key);
    } catch (const P101Error& e) {
        outcome = fail(e.getErrorCode() == ErrorCodes::UNKNOWN_REGISTER ? CalcError::UnknownRegister
                                                                         : CalcError::InvalidKey);
    }

    updateContext(key);
    return outcome;
}

CalcError KeyProcessor::setDisplayDigits(int digits) {
    if (digits < 0 || digits > Register::kMaxFloatPosition) {
        return CalcError::InvalidDigitCount;
    }
    displayDigits_ = digits;
    return CalcError::None;
}

KeyOutcome KeyProcessor::dispatch(const Key& key) {
    switch (key.code) {
        case KeyCode::Digit:
            return enterDigit(key.symbol);

        case KeyCode::Comma:
            bank_.get('M').setFloatActive(true);
            return {};

        case KeyCode::Sign:
            bank_.get('M').setSign(Register::Sign::Negative);
            return {};

        case KeyCode::Add:
            return addOrSubtract(false);
        case KeyCode::Subtract:
            return addOrSubtract(true);
        case KeyCode::Multiply:
            return multiply();
        case KeyCode::Divide:
            return divide();
        case KeyCode::SquareRoot:
            return squareRoot();
        case KeyCode::Display:
            return display();
        case KeyCode::DisplayClear:
            return displayAndClear();

        case KeyCode::ClearAll:
            bank_.clearAll();
            return {};

        case KeyCode::TransferDown:
            bank_.move('M', 'A');
            return {};

        case KeyCode::TransferUp:
            if (previousSelects(kStorageRegisters)) {
                bank_.move('M', previousKey_->symbol);
            }
            return {};

        case KeyCode::Exchange:
            return exchange();

        case KeyCode::SetDigits: {
            KeyOutcome outcome;
            outcome.awaitingDigits = true;
            return outcome;
        }

        case KeyCode::Debug:
            if (debug_) debug_(bank_);
            return {};

        case KeyCode::Register:
            // Selectors only establish context for the next key
            return {};

        case KeyCode::Undo:
            break;
    }
    return {};
}

void KeyProcessor::updateContext(const Key& key) {
    previousKeyBackup_ = previousKey_;
    previousKey_ = key;
}

KeyOutcome KeyProcessor::enterDigit(char digit) {
    if (digit < '0' || digit > '9') {
        throw P101Error(ErrorCodes::INVALID_KEY, std::string("invalid digit key '") + digit + "'");
    }
    Register& m = bank_.get('M');
    int value = digit - '0';

    if (previousIsEntry()) {
        if (m.isFull()) return fail(CalcError::RegisterFull);
        m.shift();
        m.setDigit(0, value);
    } else {
        // Any other key ends the previous entry
        m.erase();
        m.setDigit(0, value);
    }
    return {};
}

KeyOutcome KeyProcessor::addOrSubtract(bool subtract) {
    Number m = bank_.get('M').read();
    Number a = bank_.get('A').read();

    auto result = subtract ? alu_.subtract(m, a) : alu_.add(m, a);
    if (!result) return fail(result.error);

    if (auto err = bank_.get('A').write(result.value, displayDigits_); err != CalcError::None) {
        return fail(err);
    }
    return {};
}

KeyOutcome KeyProcessor::multiply() {
    auto product = alu_.multiply(bank_.get('M').read(), bank_.get('A').read());
    if (!product) return fail(product.error);

    Register a = bank_.get('A');
    Register r = bank_.get('R');
    if (auto err = a.write(product.value, displayDigits_); err != CalcError::None) return fail(err);
    if (auto err = r.writeFitting(product.value); err != CalcError::None) return fail(err);
    bank_.get('A') = a;
    bank_.get('R') = r;

    KeyOutcome outcome;
    outcome.display = formatted(product.value);
    return outcome;
}

KeyOutcome KeyProcessor::divide() {
    Number m = bank_.get('M').read();
    Number a = bank_.get('A').read();

    auto quotient = alu_.divide(m, a);
    if (!quotient) return fail(quotient.error);

    Register stagedA = bank_.get('A');
    if (auto err = stagedA.write(quotient.value, displayDigits_); err != CalcError::None) {
        return fail(err);
    }

    // Integer division also leaves the remainder in R
    if (displayDigits_ == 0) {
        auto remainder = alu_.modulo(m, a);
        if (!remainder) return fail(remainder.error);
        Register stagedR = bank_.get('R');
        if (auto err = stagedR.write(remainder.value, displayDigits_); err != CalcError::None) {
            return fail(err);
        }
        bank_.get('R') = stagedR;
    }
    bank_.get('A') = stagedA;

    KeyOutcome outcome;
    outcome.display = formatted(quotient.value);
    return outcome;
}

// A rejected root still becomes previous_key, like a rejected division
KeyOutcome KeyProcessor::squareRoot() {
    auto root = alu_.sqrt(bank_.get('M').read());
    if (!root) return fail(root.error);

    auto doubled = alu_.multiply(root.value, Integer{2});
    if (!doubled) return fail(doubled.error);

    Register a = bank_.get('A');
    Register m = bank_.get('M');
    if (auto err = a.write(root.value, displayDigits_); err != CalcError::None) return fail(err);
    if (auto err = m.write(doubled.value, displayDigits_); err != CalcError::None) return fail(err);
    bank_.get('A') = a;
    bank_.get('M') = m;

    KeyOutcome outcome;
    outcome.display = formatted(root.value);
    return outcome;
}

KeyOutcome KeyProcessor::display() {
    KeyOutcome outcome;
    if (previousSelects(kStorageRegisters)) {
        outcome.display = formatter_.raw(bank_.get(previousKey_->symbol).read());
    } else {
        outcome.display = formatted(bank_.get('M').read());
    }
    return outcome;
}

KeyOutcome KeyProcessor::displayAndClear() {
    KeyOutcome outcome;
    if (previousSelects(kReadableRegisters)) {
        char name = previousKey_->symbol;
        outcome.display = formatter_.raw(bank_.get(name).read());
        // R keeps its content after being printed
        if (name != 'R') bank_.get(name).erase();
    } else {
        outcome.display = formatted(bank_.get('M').read());
    }
    return outcome;
}

KeyOutcome KeyProcessor::exchange() {
    if (previousSelects("A")) {
        auto absolute = alu_.abs(bank_.get('A').read());
        if (!absolute) return fail(absolute.error);
        if (auto err = bank_.get('A').write(absolute.value, displayDigits_); err != CalcError::None) {
            return fail(err);
        }
    } else if (previousSelects(kStorageRegisters)) {
        bank_.swap('A', previousKey_->symbol);
    }
    return {};
}

// Helpers
bool KeyProcessor::previousIsEntry() const {
    return previousKey_ && (previousKey_->isDigit() || previousKey_->code == KeyCode::Comma);
}

bool KeyProcessor::previousSelects(const std::string& names) const {
    return previousKey_ && previousKey_->selects(names);
}

std::string KeyProcessor::formatted(const Number& value) const {
    return formatter_.format(value, displayDigits_);
}

KeyOutcome KeyProcessor::fail(CalcError error) {
    KeyOutcome outcome;
    outcome.error = error;
    return outcome;
}

} // namespace p101
