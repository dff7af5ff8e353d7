#include "render/RenderProjector.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>

const char* RenderProjector::kHints =
    "↑↓/jk move  ⏎ select  ←→ fold  space play/pause  ,/. seek  +/- volume  r retry  q quit";

namespace {

struct ImageSize {
    int width  = 0;
    int height = 0;
};

unsigned byteAt(const std::string& s, size_t i) {
    return static_cast<unsigned char>(s[i]);
}

ImageSize pngSize(const std::string& b) {
    if (b.size() < 24) return {};
    auto be32 = [&](size_t i) {
        return static_cast<int>((byteAt(b, i) << 24) | (byteAt(b, i + 1) << 16) |
                                (byteAt(b, i + 2) << 8) | byteAt(b, i + 3));
    };
    return {be32(16), be32(20)};
}

ImageSize gifSize(const std::string& b) {
    if (b.size() < 10) return {};
    return {static_cast<int>(byteAt(b, 6) | (byteAt(b, 7) << 8)),
            static_cast<int>(byteAt(b, 8) | (byteAt(b, 9) << 8))};
}

// Walk JPEG segments up to the first start-of-frame marker
ImageSize jpegSize(const std::string& b) {
    size_t i = 2;
    while (i + 9 < b.size()) {
        if (byteAt(b, i) != 0xFF) break;
        unsigned marker = byteAt(b, i + 1);
        if (marker == 0xFF) { ++i; continue; }                     // fill byte
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD8)) { i += 2; continue; }

        size_t len = (byteAt(b, i + 2) << 8) | byteAt(b, i + 3);
        bool sof = marker >= 0xC0 && marker <= 0xCF &&
                   marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
        if (sof)
            return {static_cast<int>((byteAt(b, i + 7) << 8) | byteAt(b, i + 8)),
                    static_cast<int>((byteAt(b, i + 5) << 8) | byteAt(b, i + 6))};
        if (len < 2) break;
        i += 2 + len;
    }
    return {};
}

bool startsWith(const std::string& s, const char* prefix, size_t n) {
    return s.size() >= n && s.compare(0, n, prefix, n) == 0;
}

std::string formatBytes(size_t n) {
    char buf[32];
    if (n < 1024)
        std::snprintf(buf, sizeof(buf), "%zu B", n);
    else if (n < 1024 * 1024)
        std::snprintf(buf, sizeof(buf), "%.1f KiB", n / 1024.0);
    else
        std::snprintf(buf, sizeof(buf), "%.1f MiB", n / (1024.0 * 1024.0));
    return buf;
}

std::string stateWord(const PlaybackState& s) {
    switch (s.index()) {
        case 0: return "■ Stopped";
        case 1: return "… Loading";
        case 2: return "▶ Playing";
        case 3: return "⏸ Paused";
        case 4: return "✗ Error";
    }
    return "";
}

std::vector<std::string> lyricsPanel(const TrackMedia* media, size_t maxLines) {
    if (!media) return {"No track selected"};
    if (media->lyricsFailed) return {"Lyrics unavailable"};
    if (!media->lyrics) {
        if (media->lyricsPending) return {"Loading lyrics…"};
        return {"No lyrics"};
    }
    if (media->lyrics->empty()) return {"No lyrics available"};

    std::vector<std::string> out;
    std::istringstream in(*media->lyrics);
    std::string line;
    while (out.size() < maxLines && std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        out.push_back(line);
    }
    return out;
}

std::vector<std::string> artPanel(const TrackMedia* media) {
    if (!media) return {"[no cover art]"};
    if (media->artFailed) return {"[cover art unavailable]"};
    if (!media->art) {
        if (media->artPending) return {"[loading cover art…]"};
        return {"[no cover art]"};
    }
    return {RenderProjector::describeImage(*media->art),
            formatBytes(media->art->bytes.size())};
}

}  // namespace

// ── Formatting helpers ───────────────────────────────────────────────────

std::string RenderProjector::formatTime(double seconds) {
    if (!(seconds >= 0) || std::isinf(seconds)) return "--:--";
    long total = static_cast<long>(seconds);
    char buf[24];
    std::snprintf(buf, sizeof(buf), "%02ld:%02ld", total / 60, total % 60);
    return buf;
}

std::string RenderProjector::describeImage(const ArtPayload& art) {
    const auto& b = art.bytes;
    std::string format;
    ImageSize size;

    if (startsWith(b, "\xFF\xD8\xFF", 3)) {
        format = "JPEG";
        size = jpegSize(b);
    } else if (startsWith(b, "\x89PNG\r\n\x1A\n", 8)) {
        format = "PNG";
        size = pngSize(b);
    } else if (startsWith(b, "GIF8", 4)) {
        format = "GIF";
        size = gifSize(b);
    } else if (b.size() >= 12 && startsWith(b, "RIFF", 4) && b.compare(8, 4, "WEBP") == 0) {
        format = "WEBP";
    } else if (!art.mimeType.empty()) {
        format = art.mimeType;
    } else {
        format = "image";
    }

    if (size.width > 0 && size.height > 0)
        return format + " " + std::to_string(size.width) + "x" + std::to_string(size.height);
    return format;
}

std::string RenderProjector::rowLabel(const CatalogNode& node) {
    const auto& m = node.metadata;
    std::string label;
    switch (node.kind) {
        case NodeKind::Artist:
            label = node.displayName;
            break;
        case NodeKind::Album:
            label = node.displayName;
            if (m.year > 0) label += " (" + std::to_string(m.year) + ")";
            break;
        case NodeKind::Track: {
            if (m.trackNumber > 0) {
                char num[16];
                std::snprintf(num, sizeof(num), "%02d. ", m.trackNumber);
                label = num;
            }
            label += node.displayName;
            if (m.durationSec > 0) label += "  " + formatTime(m.durationSec);
            break;
        }
    }
    if (node.loadState == LoadState::Failed && !node.failureReason.empty())
        label += "  [" + node.failureReason + "]";
    return label;
}

RowMarker RenderProjector::rowMarker(const CatalogNode& node) {
    if (!node.isContainer()) return RowMarker::Leaf;
    switch (node.loadState) {
        case LoadState::Loading: return RowMarker::Loading;
        case LoadState::Failed:  return RowMarker::Failed;
        case LoadState::NotLoaded:
        case LoadState::Loaded:
            return node.expanded ? RowMarker::Expanded : RowMarker::Collapsed;
    }
    return RowMarker::Collapsed;
}

// ── Projection ───────────────────────────────────────────────────────────

Frame RenderProjector::project(const RenderInput& in) {
    Frame f;
    auto playingTrack = trackOf(in.playback);

    // Library
    if (in.tree) {
        const auto& tree = *in.tree;
        switch (tree.rootState()) {
            case LoadState::NotLoaded:
            case LoadState::Loading:
                f.libraryMessage = "Loading library…";
                break;
            case LoadState::Failed:
                f.libraryMessage = "Library unavailable: " + tree.rootFailure() +
                                   " (r to retry)";
                break;
            case LoadState::Loaded:
                if (tree.roots().empty()) f.libraryMessage = "Library is empty";
                break;
        }

        tree.forEachVisibleRow([&](const VisibleRow& row) {
            const auto* node = tree.find(row.id);
            if (!node) return true;
            if (in.selection && *in.selection == row.id)
                f.selected = f.rows.size();
            f.rows.push_back({rowLabel(*node), row.depth, rowMarker(*node),
                              playingTrack && *playingTrack == row.id});
            return true;
        });
    }

    // Now playing
    if (playingTrack) {
        const CatalogNode* node = in.tree ? in.tree->find(*playingTrack) : nullptr;
        if (node) {
            f.nowPlaying = node->displayName;
            if (!node->metadata.artist.empty())
                f.nowPlaying += " - " + node->metadata.artist;
            if (!node->metadata.album.empty())
                f.nowPlaying += " - " + node->metadata.album;
        } else {
            f.nowPlaying = *playingTrack;
        }
    } else {
        f.nowPlaying = "Nothing playing";
    }

    // Status and progress
    double position = positionOf(in.playback);
    f.timeLabel = formatTime(position) + " / " +
                  (in.duration > 0 ? formatTime(in.duration) : std::string("--:--"));
    if (in.duration > 0)
        f.progress = std::clamp(position / in.duration, 0.0, 1.0);

    f.status = stateWord(in.playback);
    if (auto* e = std::get_if<PlaybackError>(&in.playback))
        f.status += ": " + e->reason + " (r to retry)";
    f.status += "  vol " + std::to_string(in.volume) + "%";
    f.notice = in.notice;

    f.artLines    = artPanel(in.media);
    f.lyricsLines = lyricsPanel(in.media, in.lyricsLines);
    f.hints       = kHints;
    return f;
}
