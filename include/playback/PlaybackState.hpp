#pragma once
#include "catalog/CatalogNode.hpp"
#include <optional>
#include <string>
#include <variant>

struct PlaybackIdle {
    bool operator==(const PlaybackIdle&) const { return true; }
};

struct PlaybackLoading {
    NodeId track;
    bool operator==(const PlaybackLoading& o) const { return track == o.track; }
};

struct PlaybackPlaying {
    NodeId track;
    double position = 0.0;   // seconds
    bool operator==(const PlaybackPlaying& o) const {
        return track == o.track && position == o.position;
    }
};

struct PlaybackPaused {
    NodeId track;
    double position = 0.0;
    bool operator==(const PlaybackPaused& o) const {
        return track == o.track && position == o.position;
    }
};

struct PlaybackError {
    NodeId      track;
    std::string reason;
    bool operator==(const PlaybackError& o) const {
        return track == o.track && reason == o.reason;
    }
};

// Exactly one of these is live at a time
using PlaybackState = std::variant<PlaybackIdle,
                                   PlaybackLoading,
                                   PlaybackPlaying,
                                   PlaybackPaused,
                                   PlaybackError>;

inline std::optional<NodeId> trackOf(const PlaybackState& s) {
    return std::visit([](auto& v) -> std::optional<NodeId> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, PlaybackIdle>)
            return std::nullopt;
        else
            return v.track;
    }, s);
}

inline double positionOf(const PlaybackState& s) {
    if (auto* p = std::get_if<PlaybackPlaying>(&s)) return p->position;
    if (auto* p = std::get_if<PlaybackPaused>(&s))  return p->position;
    return 0.0;
}

inline std::string stateName(const PlaybackState& s) {
    switch (s.index()) {
        case 0: return "idle";
        case 1: return "loading";
        case 2: return "playing";
        case 3: return "paused";
        case 4: return "error";
    }
    return "unknown";
}
