#include "audio/MpvAudioEngine.hpp"
#include <mpv/client.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace {

// time-pos changes every audio frame; forward at most this often
constexpr double kPositionStepSec = 0.25;

}  // namespace

MpvAudioEngine::MpvAudioEngine() = default;

MpvAudioEngine::~MpvAudioEngine() {
    close();
}

bool MpvAudioEngine::open() {
    if (handle_) return true;

    handle_ = mpv_create();
    if (!handle_) {
        spdlog::error("mpv: failed to create handle");
        return false;
    }

    mpv_set_option_string(handle_, "vid", "no");
    mpv_set_option_string(handle_, "video", "no");
    mpv_set_option_string(handle_, "terminal", "no");
    mpv_set_option_string(handle_, "idle", "yes");
    mpv_set_option_string(handle_, "audio-client-name", "HighPass");

    int rc = mpv_initialize(handle_);
    if (rc < 0) {
        spdlog::error("mpv: initialize failed: {}", mpv_error_string(rc));
        mpv_terminate_destroy(handle_);
        handle_ = nullptr;
        return false;
    }

    mpv_observe_property(handle_, 0, "time-pos", MPV_FORMAT_DOUBLE);
    mpv_observe_property(handle_, 0, "duration", MPV_FORMAT_DOUBLE);

    running_ = true;
    eventThread_ = std::thread(&MpvAudioEngine::eventLoop, this);

    spdlog::info("mpv: initialised ({})", mpvVersion());
    return true;
}

void MpvAudioEngine::close() {
    if (!handle_) return;

    running_ = false;
    mpv_wakeup(handle_);
    if (eventThread_.joinable())
        eventThread_.join();

    mpv_terminate_destroy(handle_);
    handle_ = nullptr;
    spdlog::debug("mpv: closed");
}

void MpvAudioEngine::setEventCallback(EventCallback cb) {
    std::lock_guard lock(mtx_);
    callback_ = std::move(cb);
}

// ── Commands ─────────────────────────────────────────────────────────────

void MpvAudioEngine::load(const std::string& url, uint64_t generation) {
    if (!handle_) {
        emit({EngineEvent::Type::LoadFailed, generation, 0, 0, "audio engine not open"});
        return;
    }

    // Held until the entry id is recorded so the event thread cannot see
    // START_FILE for this entry before it knows the generation
    std::unique_lock lock(mtx_);

    setProperty("pause", "no");
    if (!command({"loadfile", url.c_str(), "replace"})) {
        lock.unlock();
        emit({EngineEvent::Type::LoadFailed, generation, 0, 0, "loadfile rejected"});
        return;
    }

    // With "replace" the new file is the only playlist entry
    int64_t entryId = -1;
    int rc = mpv_get_property(handle_, "playlist/0/id", MPV_FORMAT_INT64, &entryId);
    if (rc >= 0) {
        entryGenerations_[entryId] = generation;
        unmatchedGeneration_.reset();
    } else {
        spdlog::warn("mpv: cannot read playlist entry id: {}", mpv_error_string(rc));
        unmatchedGeneration_ = generation;
    }
    spdlog::debug("mpv: loadfile gen={} entry={}", generation, entryId);
}

void MpvAudioEngine::play() {
    setProperty("pause", "no");
}

void MpvAudioEngine::pause() {
    setProperty("pause", "yes");
}

void MpvAudioEngine::seek(double seconds) {
    auto pos = std::to_string(seconds);
    command({"seek", pos.c_str(), "absolute"});
}

void MpvAudioEngine::setVolume(int level) {
    setProperty("volume", std::to_string(level));
}

void MpvAudioEngine::stop() {
    command({"stop"});

    std::lock_guard lock(mtx_);
    entryGenerations_.clear();
    unmatchedGeneration_.reset();
    activeGeneration_.reset();
}

bool MpvAudioEngine::setProperty(const char* name, const std::string& value) {
    if (!handle_) return false;
    int rc = mpv_set_property_string(handle_, name, value.c_str());
    if (rc < 0) {
        spdlog::error("mpv: set {}={} failed: {}", name, value, mpv_error_string(rc));
        return false;
    }
    return true;
}

bool MpvAudioEngine::command(std::initializer_list<const char*> args) {
    if (!handle_) return false;
    std::vector<const char*> argv(args);
    argv.push_back(nullptr);
    int rc = mpv_command(handle_, argv.data());
    if (rc < 0) {
        spdlog::error("mpv: command '{}' failed: {}", argv[0], mpv_error_string(rc));
        return false;
    }
    return true;
}

// ── Event thread ─────────────────────────────────────────────────────────

void MpvAudioEngine::eventLoop() {
    spdlog::debug("mpv event thread started");
    while (running_) {
        mpv_event* ev = mpv_wait_event(handle_, 0.25);
        if (ev->event_id == MPV_EVENT_NONE)
            continue;
        if (ev->event_id == MPV_EVENT_SHUTDOWN)
            break;
        handleEvent(*ev);
    }
    spdlog::debug("mpv event thread stopped");
}

void MpvAudioEngine::handleEvent(const mpv_event& ev) {
    std::unique_lock lock(mtx_);

    switch (ev.event_id) {
        case MPV_EVENT_START_FILE: {
            auto* sf = static_cast<mpv_event_start_file*>(ev.data);
            auto it = entryGenerations_.find(sf->playlist_entry_id);
            if (it != entryGenerations_.end()) {
                activeGeneration_ = it->second;
            } else {
                activeGeneration_ = unmatchedGeneration_;
                unmatchedGeneration_.reset();
            }
            activeLoaded_    = false;
            lastDuration_    = 0.0;
            lastReportedPos_ = -1.0;
            break;
        }

        case MPV_EVENT_FILE_LOADED: {
            if (!activeGeneration_) break;
            activeLoaded_ = true;
            auto gen = *activeGeneration_;
            lock.unlock();
            emit({EngineEvent::Type::LoadSucceeded, gen, 0, 0, ""});
            break;
        }

        case MPV_EVENT_END_FILE: {
            auto* ef = static_cast<mpv_event_end_file*>(ev.data);
            std::optional<uint64_t> gen;
            auto it = entryGenerations_.find(ef->playlist_entry_id);
            if (it != entryGenerations_.end()) {
                gen = it->second;
                entryGenerations_.erase(it);
            } else {
                gen = activeGeneration_;
            }
            bool isActive  = gen == activeGeneration_;
            bool wasLoaded = isActive && activeLoaded_;
            if (isActive) {
                activeGeneration_.reset();
                activeLoaded_ = false;
            }
            if (!gen) break;
            lock.unlock();

            switch (ef->reason) {
                case MPV_END_FILE_REASON_EOF:
                    emit({EngineEvent::Type::TrackEnded, *gen, 0, 0, ""});
                    break;
                case MPV_END_FILE_REASON_ERROR:
                    emit({endFileErrorType(isActive, wasLoaded),
                          *gen, 0, 0, mpv_error_string(ef->error)});
                    break;
                default:
                    // stop, quit, redirect: superseded by our own command
                    break;
            }
            break;
        }

        case MPV_EVENT_PROPERTY_CHANGE: {
            auto* prop = static_cast<mpv_event_property*>(ev.data);
            if (prop->format != MPV_FORMAT_DOUBLE || !prop->data)
                break;
            double value = *static_cast<double*>(prop->data);
            std::string name = prop->name;

            if (name == "duration") {
                lastDuration_ = value;
                break;
            }
            if (name == "time-pos" && activeGeneration_) {
                if (lastReportedPos_ >= 0 && value >= lastReportedPos_ &&
                    value - lastReportedPos_ < kPositionStepSec)
                    break;
                lastReportedPos_ = value;
                auto gen = *activeGeneration_;
                auto dur = lastDuration_;
                lock.unlock();
                emit({EngineEvent::Type::Position, gen, value, dur, ""});
            }
            break;
        }

        default:
            break;
    }
}

void MpvAudioEngine::emit(EngineEvent ev) {
    EventCallback cb;
    {
        std::lock_guard lock(mtx_);
        cb = callback_;
    }
    spdlog::debug("mpv: {} gen={}", engineEventTypeToString(ev.type), ev.generation);
    if (cb) cb(ev);
}

// ── Version info ─────────────────────────────────────────────────────────

std::string MpvAudioEngine::mpvVersion() const {
    if (!handle_) return "";
    char* v = mpv_get_property_string(handle_, "mpv-version");
    if (!v) return "";
    std::string out = v;
    mpv_free(v);
    return out;
}

std::string MpvAudioEngine::clientApiVersion() {
    unsigned long v = mpv_client_api_version();
    return std::to_string(v >> 16) + "." + std::to_string(v & 0xffff);
}
