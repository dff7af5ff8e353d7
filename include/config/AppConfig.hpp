#pragma once
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct SubsonicConfig {
    std::string server;
    std::string username;
    std::string password;
    std::string clientName = "highpass";
    std::string apiVersion = "1.16.1";
};

struct FetchConfig {
    int maxConcurrent = 4;
    int timeoutMs     = 5000;
    int coverArtSize  = 200;
};

struct PlaybackConfig {
    int    volume           = 80;   // 0-100
    double seekStepSeconds  = 10.0;
    int    volumeStep       = 5;
};

struct UIConfig {
    int maxEventsPerTick = 64;   // events applied before a frame is rendered
    int tickMs           = 100;  // idle wait for new events
    int lyricsLines      = 10;
};

struct LogConfig {
    std::string level = "off";
    std::string file  = "highpass.log";
};

struct AppConfig {
    SubsonicConfig subsonic;
    FetchConfig    fetch;
    PlaybackConfig playback;
    UIConfig       ui;
    LogConfig      log;

    std::string sourcePath;   // file the config was read from

    // Parse and validate. Throws ConfigError.
    static AppConfig fromJson(const nlohmann::json& j);

    // Read the first existing file: explicitPath if given, otherwise the
    // default search locations. Environment overrides are applied on top.
    static AppConfig load(const std::string& explicitPath = "");

    // ./highpass.json, then $XDG_CONFIG_HOME (or ~/.config)/highpass/highpass.json
    static std::vector<std::string> searchPaths();

    // HIGHPASS_SERVER, HIGHPASS_USERNAME, HIGHPASS_PASSWORD, HIGHPASS_LOG_LEVEL
    void applyEnvironment();
};

std::string getEnv(const std::string& key, const std::string& defaultVal = "");

// KEY=value lines; variables already set in the environment win
void loadDotEnv(const std::string& path);
