#pragma once
#include "render/Frame.hpp"
#include "session/SessionEvent.hpp"
#include <functional>
#include <mutex>
#include <optional>

namespace ftxui {
class ScreenInteractive;
struct Event;
}

// Full-screen ftxui front end. Owns the terminal on the main thread:
// keys become InputIntents, published Frames are drawn as they arrive.
// Holds no session state besides the last frame.
class TerminalUI {
public:
    using IntentSink = std::function<void(InputIntent)>;

    explicit TerminalUI(IntentSink sink);
    ~TerminalUI();

    // Store the frame and wake the screen. Callable from any thread.
    void present(const Frame& frame);

    // Run the interactive loop (blocks until exit())
    void run();

    // Leave the loop. Callable from any thread.
    void exit();

    // Key binding table
    static std::optional<InputIntent> mapKey(const ftxui::Event& event);

private:
    IntentSink sink_;

    std::mutex mtx_;                        // guards frame_ and screen_
    Frame frame_;
    ftxui::ScreenInteractive* screen_ = nullptr;
    bool exitRequested_ = false;
};
