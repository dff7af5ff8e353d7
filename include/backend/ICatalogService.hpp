#pragma once
#include "catalog/CatalogNode.hpp"
#include "fetch/FetchTypes.hpp"
#include <string>
#include <vector>

// Abstract backend: the catalog server the client browses.
// Calls block; the fetch worker pool runs them off the session loop.
// Backend failures are reported by throwing FetchError.
class ICatalogService {
public:
    virtual ~ICatalogService() = default;

    // Root listing
    virtual std::vector<CatalogNode> listArtists() = 0;

    // Albums of an artist, tracks of an album; nothing for a track
    virtual std::vector<CatalogNode> listChildren(const CatalogNode& parent) = 0;

    // Cover art for a node with a cover-art id
    virtual ArtPayload fetchArt(const CatalogNode& node) = 0;

    // Lyrics for a track; empty text when the server has none
    virtual LyricsPayload fetchLyrics(const CatalogNode& track) = 0;

    // Playable URL for a track (no I/O)
    virtual std::string streamUrl(const NodeId& trackId) const = 0;

    // Name for logging
    virtual std::string backendName() const = 0;
};
