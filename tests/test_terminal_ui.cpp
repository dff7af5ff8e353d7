#include <gtest/gtest.h>
#include "ui/TerminalUI.hpp"
#include <ftxui/component/event.hpp>

using ftxui::Event;

TEST(TerminalUITest, NavigationKeys) {
    EXPECT_EQ(TerminalUI::mapKey(Event::ArrowUp), InputIntent::MoveUp);
    EXPECT_EQ(TerminalUI::mapKey(Event::Character('k')), InputIntent::MoveUp);
    EXPECT_EQ(TerminalUI::mapKey(Event::ArrowDown), InputIntent::MoveDown);
    EXPECT_EQ(TerminalUI::mapKey(Event::Character('j')), InputIntent::MoveDown);
    EXPECT_EQ(TerminalUI::mapKey(Event::ArrowRight), InputIntent::Expand);
    EXPECT_EQ(TerminalUI::mapKey(Event::ArrowLeft), InputIntent::Collapse);
    EXPECT_EQ(TerminalUI::mapKey(Event::Return), InputIntent::Activate);
}

TEST(TerminalUITest, PlaybackKeys) {
    EXPECT_EQ(TerminalUI::mapKey(Event::Character(' ')), InputIntent::PlayPause);
    EXPECT_EQ(TerminalUI::mapKey(Event::Character('.')), InputIntent::SeekForward);
    EXPECT_EQ(TerminalUI::mapKey(Event::Character(',')), InputIntent::SeekBackward);
    EXPECT_EQ(TerminalUI::mapKey(Event::Character('+')), InputIntent::VolumeUp);
    EXPECT_EQ(TerminalUI::mapKey(Event::Character('=')), InputIntent::VolumeUp);
    EXPECT_EQ(TerminalUI::mapKey(Event::Character('-')), InputIntent::VolumeDown);
}

TEST(TerminalUITest, SessionKeys) {
    EXPECT_EQ(TerminalUI::mapKey(Event::Character('r')), InputIntent::Retry);
    EXPECT_EQ(TerminalUI::mapKey(Event::Character('q')), InputIntent::Quit);
    EXPECT_EQ(TerminalUI::mapKey(Event::Escape), InputIntent::Quit);
}

TEST(TerminalUITest, UnboundKeysAreIgnored) {
    EXPECT_FALSE(TerminalUI::mapKey(Event::Character('x')).has_value());
    EXPECT_FALSE(TerminalUI::mapKey(Event::Character('Q')).has_value());
    EXPECT_FALSE(TerminalUI::mapKey(Event::Tab).has_value());
    EXPECT_FALSE(TerminalUI::mapKey(Event::Custom).has_value());
}

TEST(TerminalUITest, PresentWithoutScreenIsSafe) {
    TerminalUI ui([](InputIntent) {});
    Frame f;
    f.status = "■ Stopped";
    ui.present(f);
    ui.exit();
}
