#pragma once
#include "IAudioEngine.hpp"

// No-op engine, used when libmpv cannot be initialised.
// Browsing and metadata still work; playback stays in Loading.
class NullAudioEngine : public IAudioEngine {
public:
    void load(const std::string&, uint64_t) override {}
    void play() override {}
    void pause() override {}
    void seek(double) override {}
    void setVolume(int) override {}
    void stop() override {}
    void setEventCallback(EventCallback) override {}
    std::string backendName() const override { return "null"; }
};
