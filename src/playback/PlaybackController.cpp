#include "playback/PlaybackController.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

PlaybackController::PlaybackController(IAudioEngine& engine, int volume)
    : engine_(engine), volume_(std::clamp(volume, 0, 100)) {}

// ── Intents ──────────────────────────────────────────────────────────────

bool PlaybackController::play(const NodeId& track, const std::string& url,
                              double knownDuration) {
    auto current = currentTrack();
    if (current && *current == track) {
        if (std::holds_alternative<PlaybackPaused>(state_))
            return resume();
        spdlog::debug("playback: play({}) ignored in state {}", track, stateName(state_));
        return false;
    }

    url_      = url;
    duration_ = knownDuration > 0 ? knownDuration : 0.0;
    startLoad(track);
    return true;
}

bool PlaybackController::pause() {
    auto* p = std::get_if<PlaybackPlaying>(&state_);
    if (!p) return false;
    engine_.pause();
    transition(PlaybackPaused{p->track, p->position});
    return true;
}

bool PlaybackController::resume() {
    auto* p = std::get_if<PlaybackPaused>(&state_);
    if (!p) return false;
    engine_.play();
    transition(PlaybackPlaying{p->track, p->position});
    return true;
}

bool PlaybackController::togglePlayPause() {
    if (std::holds_alternative<PlaybackPlaying>(state_)) return pause();
    if (std::holds_alternative<PlaybackPaused>(state_))  return resume();
    return false;
}

bool PlaybackController::retry() {
    auto* e = std::get_if<PlaybackError>(&state_);
    if (!e) return false;
    NodeId track = e->track;
    spdlog::info("playback: retrying {}", track);
    startLoad(track);
    return true;
}

bool PlaybackController::seek(double offset) {
    if (!std::holds_alternative<PlaybackPlaying>(state_) &&
        !std::holds_alternative<PlaybackPaused>(state_)) {
        spdlog::info("playback: seek ignored in state {}", stateName(state_));
        return false;
    }

    offset = std::max(0.0, offset);
    if (duration_ > 0) offset = std::min(offset, duration_);

    engine_.seek(offset);
    if (auto* p = std::get_if<PlaybackPlaying>(&state_))
        p->position = offset;
    else if (auto* p = std::get_if<PlaybackPaused>(&state_))
        p->position = offset;
    return true;
}

bool PlaybackController::seekBy(double delta) {
    return seek(positionOf(state_) + delta);
}

void PlaybackController::setVolume(int level) {
    volume_ = std::clamp(level, 0, 100);
    engine_.setVolume(volume_);
}

void PlaybackController::adjustVolume(int delta) {
    setVolume(volume_ + delta);
}

void PlaybackController::stop() {
    engine_.stop();
    ++generation_;
    duration_ = 0.0;
    transition(PlaybackIdle{});
}

// ── Engine events ────────────────────────────────────────────────────────

bool PlaybackController::onEngineEvent(const EngineEvent& ev) {
    if (ev.generation != generation_) {
        spdlog::debug("playback: dropping stale {} (gen {} != {})",
                      engineEventTypeToString(ev.type), ev.generation, generation_);
        return false;
    }

    auto track = currentTrack();
    if (!track) return false;

    switch (ev.type) {
        case EngineEvent::Type::LoadSucceeded:
            if (!std::holds_alternative<PlaybackLoading>(state_)) return false;
            transition(PlaybackPlaying{*track, 0.0});
            return true;

        case EngineEvent::Type::LoadFailed:
            if (!std::holds_alternative<PlaybackLoading>(state_)) return false;
            transition(PlaybackError{*track, ev.reason});
            return true;

        case EngineEvent::Type::Position: {
            if (ev.duration > 0) duration_ = ev.duration;
            auto* p = std::get_if<PlaybackPlaying>(&state_);
            if (!p) return false;
            p->position = std::max(0.0, ev.position);
            return true;
        }

        case EngineEvent::Type::TrackEnded:
            if (!std::holds_alternative<PlaybackPlaying>(state_) &&
                !std::holds_alternative<PlaybackPaused>(state_))
                return false;
            transition(PlaybackIdle{});
            return true;

        case EngineEvent::Type::EngineError:
            if (std::holds_alternative<PlaybackError>(state_)) return false;
            transition(PlaybackError{*track, ev.reason});
            return true;
    }
    return false;
}

void PlaybackController::startLoad(const NodeId& track) {
    ++generation_;
    transition(PlaybackLoading{track});
    engine_.load(url_, generation_);
}

void PlaybackController::transition(PlaybackState next) {
    if (next.index() != state_.index())
        spdlog::info("playback: {} -> {}", stateName(state_), stateName(next));
    state_ = std::move(next);
}
