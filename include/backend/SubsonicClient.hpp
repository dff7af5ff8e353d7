#pragma once
#include "ICatalogService.hpp"
#include "config/AppConfig.hpp"
#include <map>
#include <string>

// Subsonic REST client (cpp-httplib + nlohmann::json).
// Stateless per call, so one instance is shared by all fetch workers.
class SubsonicClient : public ICatalogService {
public:
    SubsonicClient(const SubsonicConfig& config, const FetchConfig& fetch);
    ~SubsonicClient() override;

    std::vector<CatalogNode> listArtists() override;
    std::vector<CatalogNode> listChildren(const CatalogNode& parent) override;
    ArtPayload    fetchArt(const CatalogNode& node) override;
    LyricsPayload fetchLyrics(const CatalogNode& track) override;
    std::string   streamUrl(const NodeId& trackId) const override;
    std::string   backendName() const override { return "subsonic"; }

    // Token auth: hex md5 of password + salt
    static std::string authToken(const std::string& password,
                                 const std::string& salt);
    static std::string urlEncode(const std::string& s);

private:
    using Params = std::map<std::string, std::string>;

    // Query string with auth parameters, e.g. "u=...&t=...&id=42"
    std::string buildQuery(const Params& params) const;

    // GET /rest/<endpoint>; throws FetchError on transport or HTTP failure
    std::string get(const std::string& endpoint, const Params& params,
                    std::string* contentType = nullptr) const;

    static std::string randomSalt();

    SubsonicConfig config_;
    FetchConfig    fetch_;
};
