#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace p101 {

// Keys of the machine's keyboard
enum class KeyCode {
    Digit,          // 0-9, symbol holds the digit
    Comma,          // decimal point
    Sign,           // negative sign
    Add,
    Subtract,
    Multiply,
    Divide,
    SquareRoot,
    Display,        // print M, or the selected storage register
    DisplayClear,   // print the selected register and clear it
    ClearAll,
    TransferDown,   // M -> A
    TransferUp,     // M -> selected storage register
    Exchange,       // |A|, or swap A with the selected register
    SetDigits,
    Undo,
    Debug,
    Register        // register selector, symbol holds the name
};

struct Key {
    KeyCode code{KeyCode::Digit};
    char symbol{'\0'};

    bool operator==(const Key& other) const { return code == other.code && symbol == other.symbol; }
    bool operator!=(const Key& other) const { return !(*this == other); }

    bool isDigit() const { return code == KeyCode::Digit; }
    // True for a register selector naming one of 'names'
    bool selects(const std::string& names) const {
        return code == KeyCode::Register && names.find(symbol) != std::string::npos;
    }
};

/**
 * Keyboard
 *
 * Decodes one input token (a single glyph such as "×" or one of its ASCII
 * aliases such as "x") into a Key. Tokens that are not exactly one known
 * glyph are rejected.
 */
class Keyboard {
public:
    Keyboard();

    std::optional<Key> decode(const std::string& token) const;
    std::string glyph(const Key& key) const;   // canonical glyph for traces

private:
    std::unordered_map<std::string, Key> keys_;
    std::unordered_map<KeyCode, std::string> glyphs_;

    void initializeTables();
    void addKey(const std::string& glyph, KeyCode code, char symbol = '\0');
    void addAlias(const std::string& alias, const std::string& glyph);
};

} // namespace p101
