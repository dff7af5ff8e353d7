#pragma once
#include <optional>
#include <sstream>
#include <string>
#include <vector>

enum class RowMarker {
    Collapsed,
    Expanded,
    Loading,
    Failed,
    Leaf
};

inline std::string markerGlyph(RowMarker m) {
    switch (m) {
        case RowMarker::Collapsed: return "▶";
        case RowMarker::Expanded:  return "▼";
        case RowMarker::Loading:   return "…";
        case RowMarker::Failed:    return "✗";
        case RowMarker::Leaf:      return "♪";
    }
    return "?";
}

struct FrameRow {
    std::string label;
    int         depth = 0;
    RowMarker   marker = RowMarker::Leaf;
    bool        nowPlaying = false;

    bool operator==(const FrameRow& o) const {
        return label == o.label && depth == o.depth &&
               marker == o.marker && nowPlaying == o.nowPlaying;
    }
};

// Immutable snapshot of everything the terminal shows
struct Frame {
    std::vector<FrameRow>  rows;
    std::optional<size_t>  selected;        // index into rows
    std::string libraryMessage;             // shown instead of rows when set

    std::string nowPlaying;                 // title line
    std::string status;                     // state, time, volume
    std::string notice;                     // transient message, may be empty
    std::string timeLabel;                  // "mm:ss / mm:ss"
    double      progress = 0.0;             // 0..1

    std::vector<std::string> artLines;
    std::vector<std::string> lyricsLines;
    std::string hints;

    bool operator==(const Frame& o) const {
        return rows == o.rows && selected == o.selected &&
               libraryMessage == o.libraryMessage &&
               nowPlaying == o.nowPlaying && status == o.status &&
               notice == o.notice && timeLabel == o.timeLabel &&
               progress == o.progress && artLines == o.artLines &&
               lyricsLines == o.lyricsLines && hints == o.hints;
    }

    // Deterministic plain-text rendering
    std::string to_text() const {
        std::ostringstream os;
        os << "[library]\n";
        if (!libraryMessage.empty()) os << libraryMessage << '\n';
        for (size_t i = 0; i < rows.size(); ++i) {
            const auto& r = rows[i];
            os << (selected && *selected == i ? "> " : "  ")
               << std::string(static_cast<size_t>(r.depth) * 2, ' ')
               << markerGlyph(r.marker) << ' ' << r.label
               << (r.nowPlaying ? " *" : "") << '\n';
        }
        os << "[now playing]\n" << nowPlaying << '\n';
        os << "[status]\n" << status << '\n';
        if (!notice.empty()) os << notice << '\n';
        os << timeLabel << " (" << static_cast<int>(progress * 100.0) << "%)\n";
        os << "[art]\n";
        for (auto& l : artLines) os << l << '\n';
        os << "[lyrics]\n";
        for (auto& l : lyricsLines) os << l << '\n';
        os << "[keys]\n" << hints << '\n';
        return os.str();
    }
};
