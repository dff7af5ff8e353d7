#pragma once
#include <optional>
#include <string>
#include <vector>

using NodeId = std::string;

enum class NodeKind {
    Artist,
    Album,
    Track
};

enum class LoadState {
    NotLoaded,
    Loading,
    Loaded,
    Failed
};

inline std::string kindToString(NodeKind k) {
    switch (k) {
        case NodeKind::Artist: return "artist";
        case NodeKind::Album:  return "album";
        case NodeKind::Track:  return "track";
    }
    return "unknown";
}

// Backend-provided details. Which fields are filled depends on the kind:
// artists carry albumCount, albums year/songCount/coverArt, tracks the rest.
struct NodeMetadata {
    std::string artist;
    std::string album;
    std::string genre;
    std::string coverArtId;
    std::string suffix;
    int  durationSec = 0;
    int  trackNumber = 0;
    int  year        = 0;
    int  bitRate     = 0;
    int  songCount   = 0;
    int  albumCount  = 0;
};

// One artist, album or track in the browse tree.
struct CatalogNode {
    NodeId      id;
    NodeKind    kind = NodeKind::Track;
    std::string displayName;
    NodeMetadata metadata;
    NodeId      parentId;       // empty for artists

    // Child ids, set once the Children fetch succeeds (Artist/Album only)
    std::optional<std::vector<NodeId>> children;

    LoadState   loadState = LoadState::NotLoaded;
    std::string failureReason;  // set while loadState == Failed
    bool        expanded = false;

    bool isContainer() const { return kind != NodeKind::Track; }
};
