#include <SDL3/SDL.h>
#include <deque>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <unistd.h> // for isatty
#include <utility>

// P101 components
#include "Keyboard/Keyboard.hpp"
#include "KeyLoop/KeyLoop.hpp"
#include "KeyProcessor/KeyProcessor.hpp"
#include "OutputFormatter/OutputFormatter.hpp"

namespace {

const char* const kVersion = "P101 Desk Calculator v1.5";

struct Options {
    int digits{0};
    bool trace{false};
    bool console{false};
    bool help{false};
    bool version{false};
};

// SDL3-based printing tape
class P101Shell {
public:
    P101Shell(std::shared_ptr<p101::KeyProcessor> processor,
              std::shared_ptr<p101::Keyboard> keyboard,
              bool trace)
        : proc(std::move(processor)),
          loop(std::make_unique<p101::KeyLoop>(proc, std::move(keyboard))) {
        loop->setOutput([this](const std::string& text) { print(text); });
        loop->setTrace(trace);
        loop->setTraceCallback([](const std::string& key, const std::string& previous) {
            std::cerr << "TRACE " << key << " -> " << previous << "\n";
        });
        proc->setDebugCallback([this](const p101::RegisterBank& bank) {
            std::ostringstream dump;
            bank.dump(dump);
            std::string line;
            std::istringstream lines(dump.str());
            while (std::getline(lines, line)) print(line);
        });
    }

    ~P101Shell() { cleanup(); }

    bool initialize() {
        if (!SDL_Init(SDL_INIT_VIDEO)) {
            std::cerr << "SDL initialization failed: " << SDL_GetError() << std::endl;
            return false;
        }

        window = SDL_CreateWindow("P101", kScreenWidth, kScreenHeight, 0);
        if (!window) {
            std::cerr << "Window creation failed: " << SDL_GetError() << std::endl;
            return false;
        }

        renderer = SDL_CreateRenderer(window, nullptr);
        if (!renderer) {
            std::cerr << "Renderer creation failed: " << SDL_GetError() << std::endl;
            return false;
        }
        SDL_SetRenderScale(renderer, kScale, kScale);

        if (!SDL_StartTextInput(window)) {
            std::cerr << "Text input unavailable: " << SDL_GetError() << std::endl;
            return false;
        }

        print(kVersion);
        print("");
        return true;
    }

    void run() {
        SDL_Event event;

        while (running) {
            while (SDL_PollEvent(&event)) {
                handleEvent(event);
            }
            render();
            SDL_Delay(16); // ~60 FPS
        }
    }

private:
    static constexpr int kScale = 2;
    static constexpr int kCharSize = SDL_DEBUG_TEXT_FONT_CHARACTER_SIZE;
    static constexpr int kColumns = 40;
    static constexpr int kTapeLines = 24;
    static constexpr int kScreenWidth = kColumns * kCharSize * kScale;
    static constexpr int kScreenHeight = (kTapeLines + 3) * kCharSize * kScale;

    std::shared_ptr<p101::KeyProcessor> proc;
    std::unique_ptr<p101::KeyLoop> loop;
    p101::OutputFormatter formatter;

    SDL_Window* window{nullptr};
    SDL_Renderer* renderer{nullptr};
    bool running{true};

    std::deque<std::string> tape;
    std::string pendingDigits;

    void cleanup() {
        if (window) SDL_StopTextInput(window);
        if (renderer) {
            SDL_DestroyRenderer(renderer);
            renderer = nullptr;
        }
        if (window) {
            SDL_DestroyWindow(window);
            window = nullptr;
        }
        SDL_Quit();
    }

    void print(const std::string& text) {
        tape.push_back(text.substr(0, kColumns));
        while (tape.size() > static_cast<size_t>(kTapeLines)) tape.pop_front();
    }

    void handleEvent(const SDL_Event& event) {
        switch (event.type) {
        case SDL_EVENT_QUIT:
            running = false;
            break;

        case SDL_EVENT_KEY_DOWN:
            handleKeyDown(event.key);
            break;

        case SDL_EVENT_TEXT_INPUT:
            handleTextInput(event.text.text);
            break;
        }
    }

    void handleKeyDown(const SDL_KeyboardEvent& key) {
        switch (key.key) {
        case SDLK_ESCAPE:
            running = false;
            break;
        case SDLK_DOWN:
            loop->submit("↓");
            break;
        case SDLK_UP:
            loop->submit("↑");
            break;
        case SDLK_LEFT:
        case SDLK_RIGHT:
            loop->submit("↕");
            break;
        case SDLK_BACKSPACE:
            if (!pendingDigits.empty()) pendingDigits.pop_back();
            break;
        case SDLK_RETURN:
        case SDLK_KP_ENTER:
            if (loop->isAwaitingDigits()) {
                print("d " + pendingDigits);
                loop->submit(pendingDigits);
                pendingDigits.clear();
            }
            break;
        default:
            break;
        }
    }

    void handleTextInput(const std::string& text) {
        // While a digit count is pending, typed characters build the count
        if (loop->isAwaitingDigits()) {
            pendingDigits += text;
            return;
        }
        loop->submit(text);
    }

    void render() {
        SDL_SetRenderDrawColor(renderer, 240, 236, 220, 255);  // paper
        SDL_RenderClear(renderer);
        SDL_SetRenderDrawColor(renderer, 20, 20, 60, 255);     // ink

        const float lineHeight = static_cast<float>(kCharSize);
        float y = 0.0f;
        for (const auto& line : tape) {
            SDL_RenderDebugText(renderer, 0.0f, y, line.c_str());
            y += lineHeight;
        }

        // Status line: entry register and display digits
        std::string status = "M " + formatter.format(proc->bank().get('M').read(), proc->displayDigits())
                           + "  d=" + std::to_string(proc->displayDigits());
        if (loop->isAwaitingDigits()) status += "  digits? " + pendingDigits;
        SDL_RenderDebugText(renderer, 0.0f, lineHeight * (kTapeLines + 1), status.c_str());

        SDL_RenderPresent(renderer);
    }
};

void printUsage(const char* program) {
    std::cout << kVersion << "\n";
    std::cout << "Usage: " << program << " [--digits N] [--trace] [--console]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --digits N   Display digits (0-21) at start-up\n";
    std::cout << "  --trace      Print each key and the resulting context to stderr\n";
    std::cout << "  --console    Read keys from stdin even on a terminal\n";
    std::cout << "  --version    Print the version and exit\n";
    std::cout << "\n";
    std::cout << "When input is piped, the calculator runs in console mode: one key\n";
    std::cout << "per line. Otherwise it opens the printing tape window with SDL3.\n";
    std::cout << "\n";
    std::cout << "Keys:\n";
    std::cout << "  0-9 digits    , (.) decimal point    _ negative sign\n";
    std::cout << "  + - × (x) ÷ (/) √ (S)    arithmetic\n";
    std::cout << "  ◊ (=) print    * print and clear    r clear all\n";
    std::cout << "  ↓ (v) M to A   ↑ (^) M to B-F       ↕ (%) |A| or swap\n";
    std::cout << "  M A R B C D E F select register     d set digits (count on next line)\n";
    std::cout << "  u undo context    P dump registers\n";
}

// Returns false and prints a message on malformed arguments
bool parseOptions(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--version" || arg == "-v") {
            options.version = true;
        } else if (arg == "--trace") {
            options.trace = true;
        } else if (arg == "--console") {
            options.console = true;
        } else if (arg == "--digits" && i + 1 < argc) {
            options.digits = p101::parseDigitCount(argv[++i]);
            if (options.digits < 0) {
                std::cerr << "Error: --digits must be between 0 and 21" << std::endl;
                return false;
            }
        } else {
            std::cerr << "Error: unknown option '" << arg << "'" << std::endl;
            return false;
        }
    }
    return true;
}

// Console-only mode: one key per line from stdin
int runConsoleMode(const std::shared_ptr<p101::KeyProcessor>& processor,
                   const std::shared_ptr<p101::Keyboard>& keyboard,
                   bool trace) {
    if (isatty(STDIN_FILENO)) {
        std::cout << kVersion << "\n\n";
    }

    p101::KeyLoop loop(processor, keyboard);
    loop.setOutput([](const std::string& text) { std::cout << text << std::endl; });
    loop.setTrace(trace);
    loop.setTraceCallback([](const std::string& key, const std::string& previous) {
        std::cerr << "TRACE " << key << " -> " << previous << "\n";
    });
    processor->setDebugCallback([](const p101::RegisterBank& bank) { bank.dump(std::cout); });

    loop.run(std::cin);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parseOptions(argc, argv, options)) {
        return 2;
    }
    if (options.help) {
        printUsage(argv[0]);
        return 0;
    }
    if (options.version) {
        std::cout << kVersion << "\n";
        return 0;
    }

    auto keyboard = std::make_shared<p101::Keyboard>();
    auto processor = std::make_shared<p101::KeyProcessor>();
    if (auto err = processor->setDisplayDigits(options.digits); err != p101::CalcError::None) {
        std::cerr << p101::errorMessage(err) << std::endl;
        return 2;
    }

    // Check if stdin is a terminal (interactive) or piped
    bool isInputPiped = !isatty(STDIN_FILENO);

    if (isInputPiped || options.console) {
        return runConsoleMode(processor, keyboard, options.trace);
    }

    P101Shell shell(processor, keyboard, options.trace);
    if (!shell.initialize()) {
        std::cerr << "Failed to initialize P101 window" << std::endl;
        return 1;
    }
    shell.run();
    return 0;
}
