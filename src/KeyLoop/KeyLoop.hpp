#pragma once

#include <functional>
#include <istream>
#include <memory>
#include <string>
#include <utility>

namespace p101 {

class KeyProcessor;
class Keyboard;
struct Key;

/**
 * KeyLoop
 *
 * Feeds raw input lines into the KeyProcessor: each line is decoded as one
 * key, display and error lines go to the output callback, and the line
 * following the set-digits key is consumed as the display digit count.
 * Both the console front end and the window front end drive the machine
 * through this class.
 */
class KeyLoop {
public:
    // Result of submitting one line
    enum class StepResult {
        Ignored,        // not a key; context untouched
        Accepted,       // processed, nothing printed
        Displayed,      // processed, a value was printed
        Failed,         // processed, an error line was printed
        AwaitingInput   // set-digits key waiting for its count
    };

    using OutputCallback = std::function<void(const std::string&)>;
    // Trace callback: (glyph of the key, glyph of previous_key afterwards)
    using TraceCallback = std::function<void(const std::string&, const std::string&)>;

    KeyLoop(std::shared_ptr<KeyProcessor> processor,
            std::shared_ptr<Keyboard> keyboard);
    ~KeyLoop();

    // Configuration
    void setOutput(OutputCallback cb) { output = std::move(cb); }
    void setTrace(bool enabled) { traceEnabled = enabled; }
    void setTraceCallback(TraceCallback cb) { trace = std::move(cb); }

    StepResult submit(const std::string& line);
    void run(std::istream& in);   // submit every line until end of input

    bool isAwaitingDigits() const { return awaitingDigits; }

private:
    std::shared_ptr<KeyProcessor> proc;
    std::shared_ptr<Keyboard> keys;
    OutputCallback output{};
    bool traceEnabled{false};
    TraceCallback trace{};
    bool awaitingDigits{false};

    StepResult submitDigitCount(const std::string& line);
    void print(const std::string& text);
    void traceKey(const Key& key);
};

// Display digit count typed after the set-digits key; -1 if not a count
int parseDigitCount(const std::string& text);

} // namespace p101
