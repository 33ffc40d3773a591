#include "RegisterBank.hpp"

#include <string>
#include <utility>

namespace p101 {

size_t RegisterBank::indexOf(char name) {
    for (size_t i = 0; i < kNames.size(); ++i) {
        if (kNames[i] == name) return i;
    }
    throw P101Error(ErrorCodes::UNKNOWN_REGISTER,
                    std::string("unknown register '") + name + "'");
}

Register& RegisterBank::get(char name) {
    return registers_[indexOf(name)];
}

const Register& RegisterBank::get(char name) const {
    return registers_[indexOf(name)];
}

void RegisterBank::clearAll() {
    for (auto& reg : registers_) reg.erase();
}

void RegisterBank::move(char from, char to) {
    const Register& source = get(from);
    get(to) = source;
}

void RegisterBank::swap(char first, char second) {
    std::swap(get(first), get(second));
}

void RegisterBank::dump(std::ostream& out) const {
    for (size_t i = 0; i < kNames.size(); ++i) {
        out << kNames[i] << ": " << registers_[i].describe() << "\n";
    }
}

} // namespace p101
