#include "KeyLoop.hpp"

#include <exception>
#include <utility>
#include <variant>

#include "../Keyboard/Keyboard.hpp"
#include "../KeyProcessor/KeyProcessor.hpp"
#include "../Register/Register.hpp"
#include "../Runtime/P101Error.hpp"

namespace p101 {

KeyLoop::KeyLoop(std::shared_ptr<KeyProcessor> processor,
                 std::shared_ptr<Keyboard> keyboard)
    : proc(std::move(processor)), keys(std::move(keyboard)) {}

KeyLoop::~KeyLoop() = default;

KeyLoop::StepResult KeyLoop::submit(const std::string& line) {
    if (!proc || !keys) return StepResult::Ignored;

    if (awaitingDigits) return submitDigitCount(line);

    auto key = keys->decode(line);
    if (!key) return StepResult::Ignored;

    KeyOutcome outcome;
    try {
        outcome = proc->press(*key);
    } catch (const std::exception& e) {
        print(std::string("error: internal: ") + e.what());
        return StepResult::Failed;
    }
    if (traceEnabled) traceKey(*key);

    if (!outcome) {
        print(errorMessage(outcome.error));
        return StepResult::Failed;
    }
    if (outcome.awaitingDigits) {
        awaitingDigits = true;
        return StepResult::AwaitingInput;
    }
    if (outcome.display) {
        print(*outcome.display);
        return StepResult::Displayed;
    }
    return StepResult::Accepted;
}

void KeyLoop::run(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        submit(line);
    }
}

KeyLoop::StepResult KeyLoop::submitDigitCount(const std::string& line) {
    awaitingDigits = false;

    CalcError err = proc->setDisplayDigits(parseDigitCount(line));
    if (err != CalcError::None) {
        print(errorMessage(err));
        return StepResult::Failed;
    }
    return StepResult::Accepted;
}

int parseDigitCount(const std::string& text) {
    auto value = ArithmeticUnit{}.parseNumber(text);
    if (!value || !std::holds_alternative<Integer>(*value)) return -1;

    WideInt count = std::get<Integer>(*value).v;
    return count >= 0 && count <= Register::kMaxFloatPosition ? static_cast<int>(count) : -1;
}

void KeyLoop::print(const std::string& text) {
    if (output) output(text);
}

void KeyLoop::traceKey(const Key& key) {
    if (!trace) return;
    const auto& previous = proc->previousKey();
    trace(keys->glyph(key), previous ? keys->glyph(*previous) : std::string("-"));
}

} // namespace p101
