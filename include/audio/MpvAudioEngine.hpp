#pragma once
#include "IAudioEngine.hpp"
#include <atomic>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

struct mpv_handle;
struct mpv_event;

// libmpv-backed engine. Audio only; an internal thread turns mpv events
// into EngineEvents.
//
// Each load() replaces the playlist with a single entry and remembers the
// entry's playlist id together with the generation. Start/end events name
// the entry they belong to, which is how events find their generation even
// when loads overlap.
class MpvAudioEngine : public IAudioEngine {
public:
    MpvAudioEngine();
    ~MpvAudioEngine() override;

    // Create and initialise the mpv handle and start the event thread.
    // Returns false when libmpv is unusable.
    bool open();
    void close();
    bool isOpen() const { return handle_ != nullptr; }

    void load(const std::string& url, uint64_t generation) override;
    void play() override;
    void pause() override;
    void seek(double seconds) override;
    void setVolume(int level) override;
    void stop() override;

    void setEventCallback(EventCallback cb) override;
    std::string backendName() const override { return "mpv"; }

    // Runtime version string, e.g. "mpv 0.35.1" (empty if unavailable)
    std::string mpvVersion() const;

    // libmpv client API version as "major.minor"
    static std::string clientApiVersion();

    // Event for an entry that ended with an error. Only the active entry
    // that already reported FILE_LOADED fails as an engine error.
    static EngineEvent::Type endFileErrorType(bool activeEntry, bool loaded) {
        return activeEntry && loaded ? EngineEvent::Type::EngineError
                                     : EngineEvent::Type::LoadFailed;
    }

private:
    void eventLoop();
    void handleEvent(const mpv_event& ev);
    void emit(EngineEvent ev);

    bool setProperty(const char* name, const std::string& value);
    bool command(std::initializer_list<const char*> args);

    mpv_handle* handle_ = nullptr;
    std::thread eventThread_;
    std::atomic<bool> running_{false};

    std::mutex mtx_;                 // guards everything below
    EventCallback callback_;
    std::map<int64_t, uint64_t> entryGenerations_;   // playlist entry id -> generation
    std::optional<uint64_t> unmatchedGeneration_;    // load whose entry id was unreadable
    std::optional<uint64_t> activeGeneration_;
    bool   activeLoaded_ = false;
    double lastDuration_ = 0.0;
    double lastReportedPos_ = -1.0;
};
