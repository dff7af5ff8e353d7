#pragma once
#include "catalog/CatalogNode.hpp"
#include "fetch/FetchTypes.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Maps Subsonic JSON responses (f=json) onto catalog nodes.
// Servers disagree on details: ids may be numbers or strings, and a
// one-element list is sometimes sent as a bare object. Both are accepted.
struct SubsonicSchema {
    // Subsonic error code for "requested data was not found"
    static constexpr int kErrorNotFound = 70;

    static nlohmann::json parseBody(const std::string& body) {
        try {
            return nlohmann::json::parse(body);
        } catch (const nlohmann::json::parse_error& e) {
            throw FetchError(FetchError::Kind::Malformed,
                             std::string("invalid JSON: ") + e.what());
        }
    }

    // Returns the "subsonic-response" envelope, or throws when the server
    // reported a failure.
    static const nlohmann::json& unwrap(const nlohmann::json& j) {
        if (!j.is_object() || !j.contains("subsonic-response") ||
            !j["subsonic-response"].is_object())
            throw FetchError(FetchError::Kind::Malformed,
                             "missing subsonic-response envelope");

        auto& r = j["subsonic-response"];
        if (r.value("status", "") == "ok")
            return r;

        int code = 0;
        std::string message = "request failed";
        if (r.contains("error") && r["error"].is_object()) {
            code    = r["error"].value("code", 0);
            message = r["error"].value("message", message);
        }
        throw FetchError(code == kErrorNotFound ? FetchError::Kind::NotFound
                                                : FetchError::Kind::Server,
                         "subsonic error " + std::to_string(code) + ": " + message);
    }

    static CatalogNode artistFromJson(const nlohmann::json& j) {
        CatalogNode n;
        n.kind        = NodeKind::Artist;
        n.id          = str(j, "id");
        n.displayName = str(j, "name");
        n.metadata.albumCount = num(j, "albumCount");
        n.metadata.coverArtId = str(j, "coverArt");
        return n;
    }

    static CatalogNode albumFromJson(const nlohmann::json& j) {
        CatalogNode n;
        n.kind        = NodeKind::Album;
        n.id          = str(j, "id");
        n.displayName = str(j, "name");
        if (n.displayName.empty())
            n.displayName = str(j, "title");
        n.metadata.artist      = str(j, "artist");
        n.metadata.year        = num(j, "year");
        n.metadata.songCount   = num(j, "songCount");
        n.metadata.durationSec = num(j, "duration");
        n.metadata.coverArtId  = str(j, "coverArt");
        n.metadata.genre       = str(j, "genre");
        return n;
    }

    static CatalogNode songFromJson(const nlohmann::json& j) {
        CatalogNode n;
        n.kind        = NodeKind::Track;
        n.id          = str(j, "id");
        n.displayName = str(j, "title");
        n.metadata.artist      = str(j, "artist");
        n.metadata.album       = str(j, "album");
        n.metadata.genre       = str(j, "genre");
        n.metadata.coverArtId  = str(j, "coverArt");
        n.metadata.suffix      = str(j, "suffix");
        n.metadata.durationSec = num(j, "duration");
        n.metadata.trackNumber = num(j, "track");
        n.metadata.year        = num(j, "year");
        n.metadata.bitRate     = num(j, "bitRate");
        return n;
    }

    // getArtists: artists.index[].artist[]
    static std::vector<CatalogNode> parseArtists(const nlohmann::json& body) {
        auto& r = unwrap(body);
        std::vector<CatalogNode> out;
        if (!r.contains("artists") || !r["artists"].is_object())
            throw FetchError(FetchError::Kind::Malformed, "missing artists");

        for (auto& index : list(r["artists"], "index"))
            for (auto& a : list(index, "artist"))
                out.push_back(artistFromJson(a));
        return out;
    }

    // getArtist: artist.album[]
    static std::vector<CatalogNode> parseArtistAlbums(const nlohmann::json& body) {
        auto& r = unwrap(body);
        if (!r.contains("artist") || !r["artist"].is_object())
            throw FetchError(FetchError::Kind::Malformed, "missing artist");

        std::vector<CatalogNode> out;
        for (auto& a : list(r["artist"], "album"))
            out.push_back(albumFromJson(a));
        return out;
    }

    // getAlbum: album.song[]
    static std::vector<CatalogNode> parseAlbumSongs(const nlohmann::json& body) {
        auto& r = unwrap(body);
        if (!r.contains("album") || !r["album"].is_object())
            throw FetchError(FetchError::Kind::Malformed, "missing album");

        std::vector<CatalogNode> out;
        for (auto& s : list(r["album"], "song"))
            out.push_back(songFromJson(s));
        return out;
    }

    // getLyrics: lyrics.value (some servers use "$text")
    static LyricsPayload parseLyrics(const nlohmann::json& body) {
        auto& r = unwrap(body);
        LyricsPayload p;
        if (r.contains("lyrics") && r["lyrics"].is_object()) {
            p.text = str(r["lyrics"], "value");
            if (p.text.empty())
                p.text = str(r["lyrics"], "$text");
        }
        return p;
    }

private:
    static std::string str(const nlohmann::json& j, const char* key) {
        if (!j.contains(key)) return "";
        auto& v = j[key];
        if (v.is_string()) return v.get<std::string>();
        if (v.is_number_integer()) return std::to_string(v.get<long long>());
        return "";
    }

    static int num(const nlohmann::json& j, const char* key) {
        if (!j.contains(key)) return 0;
        auto& v = j[key];
        if (v.is_number()) return v.get<int>();
        if (v.is_string()) {
            try {
                return std::stoi(v.get<std::string>());
            } catch (const std::exception&) {
                return 0;
            }
        }
        return 0;
    }

    static std::vector<nlohmann::json> list(const nlohmann::json& j, const char* key) {
        if (!j.contains(key)) return {};
        auto& v = j[key];
        if (v.is_array()) return v.get<std::vector<nlohmann::json>>();
        if (v.is_object()) return {v};
        return {};
    }
};
