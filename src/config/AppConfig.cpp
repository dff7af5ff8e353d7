#include "config/AppConfig.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

std::string getEnv(const std::string& key, const std::string& defaultVal) {
    const char* val = std::getenv(key.c_str());
    return val ? val : defaultVal;
}

void loadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        // Remove quotes
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
            val = val.substr(1, val.size() - 2);
        setenv(key.c_str(), val.c_str(), 0);  // don't override existing
    }
}

namespace {

std::string requireString(const nlohmann::json& section,
                          const std::string& sectionName,
                          const char* key) {
    if (!section.contains(key) || !section[key].is_string() ||
        section[key].get<std::string>().empty())
        throw ConfigError("missing required setting " + sectionName + "." + key);
    return section[key].get<std::string>();
}

const nlohmann::json& sectionOf(const nlohmann::json& j, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!j.contains(name)) return empty;
    if (!j[name].is_object())
        throw ConfigError(std::string("section '") + name + "' must be an object");
    return j[name];
}

}  // namespace

AppConfig AppConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object())
        throw ConfigError("configuration root must be a JSON object");

    AppConfig c;
    try {
        auto& sub = sectionOf(j, "subsonic");
        c.subsonic.server     = requireString(sub, "subsonic", "server");
        c.subsonic.username   = requireString(sub, "subsonic", "username");
        c.subsonic.password   = requireString(sub, "subsonic", "password");
        c.subsonic.clientName = sub.value("client_name", c.subsonic.clientName);
        c.subsonic.apiVersion = sub.value("api_version", c.subsonic.apiVersion);

        // Trailing slash would double up in /rest/ paths
        while (!c.subsonic.server.empty() && c.subsonic.server.back() == '/')
            c.subsonic.server.pop_back();

        auto& fetch = sectionOf(j, "fetch");
        c.fetch.maxConcurrent = std::max(1, fetch.value("max_concurrent", c.fetch.maxConcurrent));
        c.fetch.timeoutMs     = std::max(100, fetch.value("timeout_ms", c.fetch.timeoutMs));
        c.fetch.coverArtSize  = fetch.value("cover_art_size", c.fetch.coverArtSize);

        auto& pb = sectionOf(j, "playback");
        c.playback.volume          = std::clamp(pb.value("volume", c.playback.volume), 0, 100);
        c.playback.seekStepSeconds = pb.value("seek_step_seconds", c.playback.seekStepSeconds);
        c.playback.volumeStep      = pb.value("volume_step", c.playback.volumeStep);

        auto& ui = sectionOf(j, "ui");
        c.ui.maxEventsPerTick = std::max(1, ui.value("max_events_per_tick", c.ui.maxEventsPerTick));
        c.ui.tickMs           = std::max(1, ui.value("tick_ms", c.ui.tickMs));
        c.ui.lyricsLines      = std::max(0, ui.value("lyrics_lines", c.ui.lyricsLines));

        auto& log = sectionOf(j, "log");
        c.log.level = log.value("level", c.log.level);
        c.log.file  = log.value("file", c.log.file);
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigError(std::string("wrong value type: ") + e.what());
    }
    return c;
}

std::vector<std::string> AppConfig::searchPaths() {
    std::vector<std::string> paths = {"./highpass.json"};

    std::string base = getEnv("XDG_CONFIG_HOME");
    if (base.empty()) {
        std::string home = getEnv("HOME");
        if (!home.empty())
            base = home + "/.config";
    }
    if (!base.empty())
        paths.push_back(base + "/highpass/highpass.json");
    return paths;
}

AppConfig AppConfig::load(const std::string& explicitPath) {
    std::vector<std::string> candidates;
    if (!explicitPath.empty())
        candidates.push_back(explicitPath);
    else
        candidates = searchPaths();

    for (auto& path : candidates) {
        spdlog::debug("Checking for config file at: {}", path);
        if (!std::filesystem::exists(path))
            continue;

        std::ifstream f(path);
        if (!f.is_open())
            throw ConfigError("cannot open config file: " + path);

        nlohmann::json j;
        try {
            f >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError("cannot parse " + path + ": " + e.what());
        }

        auto config = fromJson(j);
        config.sourcePath = path;
        config.applyEnvironment();

        spdlog::info("Loaded configuration from {}", path);
        spdlog::info("  Server: {}", config.subsonic.server);
        spdlog::info("  Username: {}", config.subsonic.username);
        return config;
    }

    std::string msg = "No configuration file found. Create one of:";
    for (auto& p : candidates)
        msg += "\n  " + p;
    throw ConfigError(msg);
}

void AppConfig::applyEnvironment() {
    auto server = getEnv("HIGHPASS_SERVER");
    if (!server.empty()) subsonic.server = server;

    auto user = getEnv("HIGHPASS_USERNAME");
    if (!user.empty()) subsonic.username = user;

    auto pass = getEnv("HIGHPASS_PASSWORD");
    if (!pass.empty()) subsonic.password = pass;

    auto level = getEnv("HIGHPASS_LOG_LEVEL");
    if (!level.empty()) log.level = level;
}
