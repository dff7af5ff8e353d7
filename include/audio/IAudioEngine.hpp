#pragma once
#include <cstdint>
#include <functional>
#include <string>

// Events reported by an audio engine. Each carries the generation of the
// load it belongs to so the playback controller can drop stale ones.
struct EngineEvent {
    enum class Type {
        LoadSucceeded,
        LoadFailed,     // reason set
        Position,       // position (and duration when known) in seconds
        TrackEnded,
        EngineError     // reason set
    };

    Type        type = Type::Position;
    uint64_t    generation = 0;
    double      position = 0.0;
    double      duration = 0.0;   // 0 = unknown
    std::string reason;
};

inline std::string engineEventTypeToString(EngineEvent::Type t) {
    switch (t) {
        case EngineEvent::Type::LoadSucceeded: return "load_succeeded";
        case EngineEvent::Type::LoadFailed:    return "load_failed";
        case EngineEvent::Type::Position:      return "position";
        case EngineEvent::Type::TrackEnded:    return "track_ended";
        case EngineEvent::Type::EngineError:   return "engine_error";
    }
    return "unknown";
}

// Abstract audio playback engine.
// Implementations: MpvAudioEngine (libmpv), NullAudioEngine (no-op).
// Commands are non-blocking; results arrive through the event callback,
// usually on an engine-owned thread.
class IAudioEngine {
public:
    virtual ~IAudioEngine() = default;

    // Start loading url; playback begins as soon as it is loaded.
    // Events for this load are tagged with generation.
    virtual void load(const std::string& url, uint64_t generation) = 0;
    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void seek(double seconds) = 0;      // absolute position
    virtual void setVolume(int level) = 0;      // 0-100
    virtual void stop() = 0;

    using EventCallback = std::function<void(const EngineEvent&)>;
    virtual void setEventCallback(EventCallback cb) = 0;

    // Name for logging
    virtual std::string backendName() const = 0;
};
