#pragma once
#include "audio/IAudioEngine.hpp"
#include "fetch/FetchTypes.hpp"
#include <string>
#include <variant>

// Discrete user intents produced by the input source
enum class InputIntent {
    MoveUp,
    MoveDown,
    ToggleExpand,
    Expand,
    Collapse,
    Activate,       // toggle a container, play a track
    PlayPause,
    SeekForward,
    SeekBackward,
    VolumeUp,
    VolumeDown,
    Retry,
    Quit
};

inline std::string intentToString(InputIntent i) {
    switch (i) {
        case InputIntent::MoveUp:       return "move_up";
        case InputIntent::MoveDown:     return "move_down";
        case InputIntent::ToggleExpand: return "toggle_expand";
        case InputIntent::Expand:       return "expand";
        case InputIntent::Collapse:     return "collapse";
        case InputIntent::Activate:     return "activate";
        case InputIntent::PlayPause:    return "play_pause";
        case InputIntent::SeekForward:  return "seek_forward";
        case InputIntent::SeekBackward: return "seek_backward";
        case InputIntent::VolumeUp:     return "volume_up";
        case InputIntent::VolumeDown:   return "volume_down";
        case InputIntent::Retry:        return "retry";
        case InputIntent::Quit:         return "quit";
    }
    return "unknown";
}

struct InputEvent {
    InputIntent intent;
};

// A worker finished a request; the session loop hands it to the scheduler
struct FetchFinished {
    FetchRequest request;
    FetchResult  result;
};

// Everything the session loop reacts to, in one ordered stream
using SessionEvent = std::variant<InputEvent, FetchFinished, EngineEvent>;
