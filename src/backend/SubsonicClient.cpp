#include "backend/SubsonicClient.hpp"
#include "backend/SubsonicSchema.hpp"
#include <httplib.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace {

std::string toHex(const unsigned char* data, size_t len) {
    std::ostringstream out;
    for (size_t i = 0; i < len; i++)
        out << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(data[i]);
    return out.str();
}

// "https://host:port/prefix" -> {"https://host:port", "/prefix"}
std::pair<std::string, std::string> splitServer(const std::string& server) {
    auto scheme = server.find("://");
    auto start  = scheme == std::string::npos ? 0 : scheme + 3;
    auto slash  = server.find('/', start);
    if (slash == std::string::npos)
        return {server, ""};
    return {server.substr(0, slash), server.substr(slash)};
}

bool looksLikeApiResponse(const std::string& contentType) {
    return contentType.rfind("application/json", 0) == 0 ||
           contentType.rfind("text/xml", 0) == 0 ||
           contentType.rfind("application/xml", 0) == 0;
}

}  // namespace

SubsonicClient::SubsonicClient(const SubsonicConfig& config,
                               const FetchConfig& fetch)
    : config_(config), fetch_(fetch) {}

SubsonicClient::~SubsonicClient() = default;

// ── Auth / URL helpers ───────────────────────────────────────────────────

std::string SubsonicClient::authToken(const std::string& password,
                                      const std::string& salt) {
    std::string input = password + salt;
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &len,
                   EVP_md5(), nullptr) != 1)
        throw std::runtime_error("md5 digest failed");
    return toHex(digest, len);
}

std::string SubsonicClient::randomSalt() {
    unsigned char buf[8];
    if (RAND_bytes(buf, sizeof(buf)) != 1)
        throw std::runtime_error("cannot generate auth salt");
    return toHex(buf, sizeof(buf));
}

std::string SubsonicClient::urlEncode(const std::string& s) {
    std::ostringstream out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::uppercase << std::hex << std::setw(2)
                << std::setfill('0') << static_cast<int>(c) << std::nouppercase;
        }
    }
    return out.str();
}

std::string SubsonicClient::buildQuery(const Params& params) const {
    auto salt = randomSalt();
    std::vector<std::pair<std::string, std::string>> query = {
        {"u", config_.username},
        {"t", authToken(config_.password, salt)},
        {"s", salt},
        {"v", config_.apiVersion},
        {"c", config_.clientName},
        {"f", "json"},
    };
    query.insert(query.end(), params.begin(), params.end());

    std::string out;
    for (auto& [key, value] : query) {
        if (!out.empty()) out += '&';
        out += key + "=" + urlEncode(value);
    }
    return out;
}

std::string SubsonicClient::streamUrl(const NodeId& trackId) const {
    return config_.server + "/rest/stream?" + buildQuery({{"id", trackId}});
}

// ── HTTP ─────────────────────────────────────────────────────────────────

std::string SubsonicClient::get(const std::string& endpoint,
                                const Params& params,
                                std::string* contentType) const {
    auto [host, prefix] = splitServer(config_.server);

    httplib::Client cli(host);
    cli.set_connection_timeout(fetch_.timeoutMs / 1000,
                               (fetch_.timeoutMs % 1000) * 1000);
    cli.set_read_timeout(fetch_.timeoutMs / 1000,
                         (fetch_.timeoutMs % 1000) * 1000);
    cli.set_follow_location(true);

    std::string path = prefix + "/rest/" + endpoint + "?" + buildQuery(params);
    spdlog::debug("GET {} ({} params)", endpoint, params.size());

    auto res = cli.Get(path);
    if (!res) {
        throw FetchError(FetchError::Kind::Network,
                         endpoint + ": " + httplib::to_string(res.error()));
    }
    if (res->status == 404) {
        throw FetchError(FetchError::Kind::NotFound, endpoint + ": HTTP 404");
    }
    if (res->status >= 400) {
        throw FetchError(FetchError::Kind::Server,
                         endpoint + ": HTTP " + std::to_string(res->status));
    }

    if (contentType)
        *contentType = res->get_header_value("Content-Type");
    return res->body;
}

// ── Catalog ──────────────────────────────────────────────────────────────

std::vector<CatalogNode> SubsonicClient::listArtists() {
    auto body = SubsonicSchema::parseBody(get("getArtists", {}));
    return SubsonicSchema::parseArtists(body);
}

std::vector<CatalogNode> SubsonicClient::listChildren(const CatalogNode& parent) {
    switch (parent.kind) {
        case NodeKind::Artist: {
            auto body = SubsonicSchema::parseBody(
                get("getArtist", {{"id", parent.id}}));
            return SubsonicSchema::parseArtistAlbums(body);
        }
        case NodeKind::Album: {
            auto body = SubsonicSchema::parseBody(
                get("getAlbum", {{"id", parent.id}}));
            return SubsonicSchema::parseAlbumSongs(body);
        }
        case NodeKind::Track:
            return {};
    }
    return {};
}

ArtPayload SubsonicClient::fetchArt(const CatalogNode& node) {
    if (node.metadata.coverArtId.empty())
        throw FetchError(FetchError::Kind::NotFound,
                         "no cover art for '" + node.displayName + "'");

    std::string contentType;
    auto body = get("getCoverArt",
                    {{"id", node.metadata.coverArtId},
                     {"size", std::to_string(fetch_.coverArtSize)}},
                    &contentType);

    // Errors come back as a regular API response instead of image bytes
    if (looksLikeApiResponse(contentType)) {
        SubsonicSchema::unwrap(SubsonicSchema::parseBody(body));
        throw FetchError(FetchError::Kind::Server,
                         "getCoverArt returned " + contentType);
    }
    if (body.empty())
        throw FetchError(FetchError::Kind::NotFound, "empty cover art");

    spdlog::debug("Cover art for '{}': {} bytes ({})", node.displayName,
                  body.size(), contentType);
    return ArtPayload{std::move(body), contentType};
}

LyricsPayload SubsonicClient::fetchLyrics(const CatalogNode& track) {
    if (track.metadata.artist.empty() || track.displayName.empty())
        throw FetchError(FetchError::Kind::NotFound,
                         "missing artist or title for lyrics lookup");

    auto body = SubsonicSchema::parseBody(
        get("getLyrics", {{"artist", track.metadata.artist},
                          {"title",  track.displayName}}));
    return SubsonicSchema::parseLyrics(body);
}
