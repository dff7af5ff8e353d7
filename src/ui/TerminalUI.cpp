#include "ui/TerminalUI.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <spdlog/spdlog.h>

using namespace ftxui;

namespace {

Elements textLines(const std::vector<std::string>& lines) {
    Elements out;
    for (auto& l : lines)
        out.push_back(text(" " + l));
    return out;
}

Element libraryPanel(const Frame& f) {
    Elements rows;
    if (!f.libraryMessage.empty())
        rows.push_back(text(" " + f.libraryMessage) | dim);

    for (size_t i = 0; i < f.rows.size(); i++) {
        auto& r = f.rows[i];
        Color markerColor = Color::White;
        switch (r.marker) {
            case RowMarker::Loading: markerColor = Color::Yellow; break;
            case RowMarker::Failed:  markerColor = Color::Red; break;
            case RowMarker::Leaf:    markerColor = Color::GrayLight; break;
            case RowMarker::Collapsed:
            case RowMarker::Expanded: markerColor = Color::Cyan; break;
        }

        auto line = hbox({
            text(std::string(static_cast<size_t>(r.depth) * 2 + 1, ' ')),
            text(markerGlyph(r.marker)) | color(markerColor),
            text(" " + r.label),
            filler(),
        });
        if (r.nowPlaying)
            line = line | bold | color(Color::Green);
        if (f.selected && *f.selected == i)
            line = line | inverted | focus;
        rows.push_back(line);
    }

    return vbox({
        text(" Library") | bold,
        separator(),
        vbox(rows) | vscroll_indicator | yframe | flex,
    }) | border | flex;
}

Element sidePanel(const Frame& f) {
    auto statusLine = hbox({
        text(" " + f.status),
        filler(),
    });

    Elements controls = {statusLine};
    if (!f.notice.empty())
        controls.push_back(text(" " + f.notice) | color(Color::Yellow));

    return vbox({
        vbox({
            text(" Now Playing") | bold,
            separator(),
            paragraph(" " + f.nowPlaying),
        }) | border,
        vbox({
            text(" Cover Art") | bold,
            separator(),
            vbox(textLines(f.artLines)) | dim,
        }) | border,
        vbox({
            text(" Lyrics") | bold,
            separator(),
            vbox(textLines(f.lyricsLines)) | flex,
        }) | border | flex,
        vbox({
            hbox({
                text(" " + f.timeLabel + " "),
                gauge(static_cast<float>(f.progress)) | color(Color::Cyan) | flex,
                text(" "),
            }),
            separator(),
            vbox(controls),
        }) | border,
    }) | size(WIDTH, GREATER_THAN, 40) | flex;
}

}  // namespace

TerminalUI::TerminalUI(IntentSink sink)
    : sink_(std::move(sink)) {}

TerminalUI::~TerminalUI() = default;

void TerminalUI::present(const Frame& frame) {
    std::lock_guard lock(mtx_);
    frame_ = frame;
    if (screen_)
        screen_->PostEvent(Event::Custom);
}

void TerminalUI::exit() {
    std::lock_guard lock(mtx_);
    exitRequested_ = true;
    if (screen_)
        screen_->Exit();
}

std::optional<InputIntent> TerminalUI::mapKey(const Event& event) {
    if (event == Event::ArrowUp   || event == Event::Character('k')) return InputIntent::MoveUp;
    if (event == Event::ArrowDown || event == Event::Character('j')) return InputIntent::MoveDown;
    if (event == Event::Return)                                      return InputIntent::Activate;
    if (event == Event::ArrowRight || event == Event::Character('l')) return InputIntent::Expand;
    if (event == Event::ArrowLeft  || event == Event::Character('h')) return InputIntent::Collapse;
    if (event == Event::Character(' '))                              return InputIntent::PlayPause;
    if (event == Event::Character('.'))                              return InputIntent::SeekForward;
    if (event == Event::Character(','))                              return InputIntent::SeekBackward;
    if (event == Event::Character('+') || event == Event::Character('=')) return InputIntent::VolumeUp;
    if (event == Event::Character('-'))                              return InputIntent::VolumeDown;
    if (event == Event::Character('r'))                              return InputIntent::Retry;
    if (event == Event::Character('q') || event == Event::Escape)    return InputIntent::Quit;
    return std::nullopt;
}

void TerminalUI::run() {
    auto screen = ScreenInteractive::Fullscreen();
    {
        std::lock_guard lock(mtx_);
        if (exitRequested_) return;
        screen_ = &screen;
    }

    auto renderer = Renderer([&] {
        Frame f;
        {
            std::lock_guard lock(mtx_);
            f = frame_;
        }

        // ── Header ──
        auto header = hbox({
            text(" HighPass ") | bold | color(Color::Cyan) | inverted,
            text(" "),
            text(f.nowPlaying) | color(Color::Green),
            filler(),
        });

        return vbox({
            header,
            hbox({
                libraryPanel(f) | size(WIDTH, LESS_THAN, 80),
                sidePanel(f),
            }) | flex,
            hbox({ text(" " + f.hints) | dim }) | borderLight,
        });
    });

    auto component = CatchEvent(renderer, [&](Event event) {
        if (event == Event::Custom)
            return true;    // redraw only
        auto intent = mapKey(event);
        if (!intent)
            return false;
        if (sink_)
            sink_(*intent);
        return true;
    });

    spdlog::debug("Terminal UI loop started");
    screen.Loop(component);
    spdlog::debug("Terminal UI loop stopped");

    std::lock_guard lock(mtx_);
    screen_ = nullptr;
}
