#pragma once
#include "audio/IAudioEngine.hpp"
#include "backend/ICatalogService.hpp"
#include "catalog/CatalogNode.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

// ── Node builders ────────────────────────────────────────────────────────

inline CatalogNode makeArtist(const std::string& id, const std::string& name = "") {
    CatalogNode n;
    n.id = id;
    n.kind = NodeKind::Artist;
    n.displayName = name.empty() ? id : name;
    return n;
}

inline CatalogNode makeAlbum(const std::string& id, const std::string& name = "") {
    CatalogNode n;
    n.id = id;
    n.kind = NodeKind::Album;
    n.displayName = name.empty() ? id : name;
    return n;
}

inline CatalogNode makeTrack(const std::string& id, const std::string& name = "",
                             const std::string& coverArt = "") {
    CatalogNode n;
    n.id = id;
    n.kind = NodeKind::Track;
    n.displayName = name.empty() ? id : name;
    n.metadata.coverArtId = coverArt;
    n.metadata.artist = "Artist";
    n.metadata.durationSec = 180;
    return n;
}

// ── Recording audio engine ───────────────────────────────────────────────

// Records every command as a string such as "load:url#3" or "seek:42"
class FakeAudioEngine : public IAudioEngine {
public:
    void load(const std::string& url, uint64_t generation) override {
        commands.push_back("load:" + url + "#" + std::to_string(generation));
    }
    void play() override  { commands.push_back("play"); }
    void pause() override { commands.push_back("pause"); }
    void seek(double seconds) override {
        commands.push_back("seek:" + std::to_string(static_cast<int>(seconds)));
    }
    void setVolume(int level) override {
        commands.push_back("volume:" + std::to_string(level));
    }
    void stop() override { commands.push_back("stop"); }

    void setEventCallback(EventCallback cb) override { callback = std::move(cb); }
    std::string backendName() const override { return "fake"; }

    size_t count(const std::string& prefix) const {
        size_t n = 0;
        for (auto& c : commands)
            if (c.rfind(prefix, 0) == 0) n++;
        return n;
    }

    std::vector<std::string> commands;
    EventCallback callback;
};

// ── Scripted catalog service ─────────────────────────────────────────────

class FakeCatalogService : public ICatalogService {
public:
    std::vector<CatalogNode> listArtists() override {
        record("artists");
        if (failArtists) throw FetchError(FetchError::Kind::Network, "connection refused");
        return artists;
    }

    std::vector<CatalogNode> listChildren(const CatalogNode& parent) override {
        record("children:" + parent.id);
        auto it = children.find(parent.id);
        if (it == children.end())
            throw FetchError(FetchError::Kind::NotFound, "no such node " + parent.id);
        return it->second;
    }

    ArtPayload fetchArt(const CatalogNode& node) override {
        record("art:" + node.id);
        if (failArt) throw FetchError(FetchError::Kind::Server, "art backend down");
        return {"\xFF\xD8\xFF\xE0", "image/jpeg"};
    }

    LyricsPayload fetchLyrics(const CatalogNode& track) override {
        record("lyrics:" + track.id);
        if (throwStd) throw std::runtime_error("unexpected");
        return {"line one\nline two"};
    }

    std::string streamUrl(const NodeId& trackId) const override {
        return "stream://" + trackId;
    }

    std::string backendName() const override { return "fake"; }

    // Workers call in from several threads
    void record(const std::string& call) {
        std::lock_guard lock(mtx);
        calls.push_back(call);
    }

    std::vector<CatalogNode> artists;
    std::map<NodeId, std::vector<CatalogNode>> children;
    bool failArtists = false;
    bool failArt     = false;
    bool throwStd    = false;
    std::vector<std::string> calls;
    std::mutex mtx;
};
