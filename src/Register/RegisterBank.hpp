#pragma once

#include <array>
#include <cstddef>
#include <ostream>

#include "Register.hpp"

namespace p101 {

/**
 * RegisterBank
 *
 * The eight named registers of the machine: M (entry), A (accumulator),
 * R (remainder / full product) and the storage registers B to F.
 * Registers are addressed by name; assignment between them copies content.
 */
class RegisterBank {
public:
    static constexpr size_t kCount = 8;
    static constexpr std::array<char, kCount> kNames{'M', 'A', 'R', 'B', 'C', 'D', 'E', 'F'};

    RegisterBank() = default;

    // Lookup; throws P101Error for a name outside kNames
    Register& get(char name);
    const Register& get(char name) const;

    void clearAll();
    void move(char from, char to);   // copies, does not erase 'from'
    void swap(char first, char second);

    // One line per register: "M: [digits] fp=.. float=.. sign=.."
    void dump(std::ostream& out) const;

private:
    std::array<Register, kCount> registers_{};

    static size_t indexOf(char name);
};

} // namespace p101
