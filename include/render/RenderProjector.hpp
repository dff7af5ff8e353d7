#pragma once
#include "Frame.hpp"
#include "catalog/CatalogTree.hpp"
#include "fetch/FetchTypes.hpp"
#include "playback/PlaybackState.hpp"
#include <optional>
#include <string>

// Art and lyrics known for one track during the session
struct TrackMedia {
    std::optional<ArtPayload> art;
    bool artPending = false;
    bool artFailed  = false;

    std::optional<std::string> lyrics;
    bool lyricsPending = false;
    bool lyricsFailed  = false;
};

// Everything a frame is computed from. Pointers may be null.
struct RenderInput {
    const CatalogTree*    tree = nullptr;
    std::optional<NodeId> selection;
    PlaybackState         playback;
    double                duration = 0.0;
    int                   volume = 0;
    const TrackMedia*     media = nullptr;   // for the playing or selected track
    std::string           notice;
    size_t                lyricsLines = 10;
};

// Pure projection of session state into a Frame. No I/O, no mutation:
// the same input always yields the same frame.
class RenderProjector {
public:
    static Frame project(const RenderInput& in);

    // "mm:ss", or "--:--" when unknown
    static std::string formatTime(double seconds);

    // Short description of encoded image bytes, e.g. "PNG 300x300"
    static std::string describeImage(const ArtPayload& art);

    static std::string rowLabel(const CatalogNode& node);
    static RowMarker   rowMarker(const CatalogNode& node);

    static const char* kHints;
};
