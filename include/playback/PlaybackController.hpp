#pragma once
#include "PlaybackState.hpp"
#include "audio/IAudioEngine.hpp"
#include <cstdint>
#include <string>

// Finite-state wrapper around the audio engine and the only component
// that issues engine commands.
//
//   Idle      --play(t)-------------------> Loading(t)
//   Loading   --load_succeeded------------> Playing(t, 0)
//   Loading   --load_failed---------------> Error(t, reason)
//   Playing   --pause / tick / ended------> Paused / Playing(p') / Idle
//   Paused    --resume--------------------> Playing
//   any       --play(t2), t2 != current---> Loading(t2)
//   Error     --retry---------------------> Loading(t)
//
// Every load bumps the generation; engine events from older generations
// are dropped.
class PlaybackController {
public:
    explicit PlaybackController(IAudioEngine& engine, int volume = 80);

    // ── Intents ── return true when the intent was applied
    bool play(const NodeId& track, const std::string& url, double knownDuration = 0.0);
    bool pause();
    bool resume();
    bool togglePlayPause();
    bool retry();
    bool seek(double offset);       // absolute, Playing/Paused only
    bool seekBy(double delta);
    void setVolume(int level);
    void adjustVolume(int delta);
    void stop();

    // ── Engine events ── returns true when the event changed the state
    bool onEngineEvent(const EngineEvent& ev);

    const PlaybackState& state() const { return state_; }
    std::optional<NodeId> currentTrack() const { return trackOf(state_); }
    uint64_t generation() const { return generation_; }
    int      volume() const { return volume_; }
    double   duration() const { return duration_; }

private:
    void startLoad(const NodeId& track);
    void transition(PlaybackState next);

    IAudioEngine& engine_;
    PlaybackState state_ = PlaybackIdle{};
    uint64_t      generation_ = 0;
    std::string   url_;            // source of the current track, for retry
    int           volume_;
    double        duration_ = 0.0; // seconds, 0 = unknown
};
