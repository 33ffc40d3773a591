#include "Keyboard.hpp"

#include "../Register/RegisterBank.hpp"

namespace p101 {

Keyboard::Keyboard() {
    initializeTables();
}

void Keyboard::initializeTables() {
    // Digit keys
    for (char d = '0'; d <= '9'; ++d) {
        addKey(std::string(1, d), KeyCode::Digit, d);
    }

    // Register selectors
    for (char name : RegisterBank::kNames) {
        addKey(std::string(1, name), KeyCode::Register, name);
    }

    // Function keys, canonical glyphs as printed on the keyboard
    addKey(",", KeyCode::Comma);
    addKey("_", KeyCode::Sign);
    addKey("+", KeyCode::Add);
    addKey("-", KeyCode::Subtract);
    addKey("×", KeyCode::Multiply);
    addKey("÷", KeyCode::Divide);
    addKey("√", KeyCode::SquareRoot);
    addKey("◊", KeyCode::Display);
    addKey("*", KeyCode::DisplayClear);
    addKey("r", KeyCode::ClearAll);
    addKey("↓", KeyCode::TransferDown);
    addKey("↑", KeyCode::TransferUp);
    addKey("↕", KeyCode::Exchange);
    addKey("d", KeyCode::SetDigits);
    addKey("u", KeyCode::Undo);
    addKey("P", KeyCode::Debug);

    // ASCII aliases for terminals without the special glyphs
    addAlias(".", ",");
    addAlias("x", "×");
    addAlias("/", "÷");
    addAlias("S", "√");
    addAlias("=", "◊");
    addAlias("v", "↓");
    addAlias("^", "↑");
    addAlias("%", "↕");
}

void Keyboard::addKey(const std::string& glyph, KeyCode code, char symbol) {
    keys_[glyph] = Key{code, symbol};
    if (code != KeyCode::Digit && code != KeyCode::Register) {
        glyphs_[code] = glyph;
    }
}

void Keyboard::addAlias(const std::string& alias, const std::string& glyph) {
    keys_[alias] = keys_.at(glyph);
}

std::optional<Key> Keyboard::decode(const std::string& token) const {
    // A line read from a CRLF file keeps its carriage return
    std::string glyph = token;
    if (!glyph.empty() && glyph.back() == '\r') glyph.pop_back();

    auto it = keys_.find(glyph);
    if (it == keys_.end()) return std::nullopt;
    return it->second;
}

std::string Keyboard::glyph(const Key& key) const {
    if (key.code == KeyCode::Digit || key.code == KeyCode::Register) {
        return std::string(1, key.symbol);
    }
    auto it = glyphs_.find(key.code);
    return it != glyphs_.end() ? it->second : std::string("?");
}

} // namespace p101
