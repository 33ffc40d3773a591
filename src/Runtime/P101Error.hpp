#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace p101 {

/**
 * CalcError - calculator conditions reported as values
 *
 * These are the outcomes a key press can legitimately produce. They are
 * shown on the tape and the machine keeps accepting keys afterwards.
 */
enum class CalcError {
    None = 0,
    RegisterOverflow,     // value needs more than 22 digits
    RegisterFull,         // digit entry rejected, M unchanged
    DivisionByZero,
    NegativeSqrtOperand,
    InvalidDigitCount,    // display digits outside 0..21
    UnknownRegister,
    InvalidKey
};

// Result type for register and arithmetic operations
template<typename T>
struct CalcResult {
    T value{};
    CalcError error{CalcError::None};

    explicit operator bool() const { return error == CalcError::None; }
};

// One-line text printed for an error condition
inline std::string errorMessage(CalcError error) {
    switch (error) {
        case CalcError::None: return "";
        case CalcError::RegisterOverflow: return "error: value too big for register";
        case CalcError::RegisterFull: return "error: M register is full";
        case CalcError::DivisionByZero: return "error: division by zero";
        case CalcError::NegativeSqrtOperand: return "error: square root of negative number";
        case CalcError::InvalidDigitCount: return "error: display digits must be between 0 and 21";
        case CalcError::UnknownRegister: return "error: unknown register";
        case CalcError::InvalidKey: return "error: invalid key";
    }
    return "error: unknown condition";
}

/**
 * P101Error - internal fault of the calculator core
 *
 * Thrown for lookups that the fixed key alphabet should never produce,
 * e.g. asking the bank for a register that does not exist.
 */
class P101Error : public std::runtime_error {
public:
    P101Error(uint16_t errorCode, const std::string& message)
        : std::runtime_error(message), errorCode_(errorCode) {}

    uint16_t getErrorCode() const { return errorCode_; }

private:
    uint16_t errorCode_;
};

namespace ErrorCodes {
    constexpr uint16_t UNKNOWN_REGISTER = 1;
    constexpr uint16_t INVALID_KEY = 2;
}

} // namespace p101
