#include <gtest/gtest.h>
#include "audio/MpvAudioEngine.hpp"
#include <vector>

TEST(MpvAudioEngineTest, EndFileErrorClassification) {
    EXPECT_EQ(MpvAudioEngine::endFileErrorType(true, true), EngineEvent::Type::EngineError);
    EXPECT_EQ(MpvAudioEngine::endFileErrorType(true, false), EngineEvent::Type::LoadFailed);

    // Superseded entry: whatever the active entry did is irrelevant
    EXPECT_EQ(MpvAudioEngine::endFileErrorType(false, true), EngineEvent::Type::LoadFailed);
    EXPECT_EQ(MpvAudioEngine::endFileErrorType(false, false), EngineEvent::Type::LoadFailed);
}

TEST(MpvAudioEngineTest, LoadWithoutHandleFailsWithItsGeneration) {
    MpvAudioEngine engine;
    std::vector<EngineEvent> seen;
    engine.setEventCallback([&](const EngineEvent& ev) { seen.push_back(ev); });

    EXPECT_FALSE(engine.isOpen());
    engine.load("http://example.invalid/stream", 7);

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].type, EngineEvent::Type::LoadFailed);
    EXPECT_EQ(seen[0].generation, 7u);
    EXPECT_FALSE(seen[0].reason.empty());
    EXPECT_EQ(engine.mpvVersion(), "");
}
