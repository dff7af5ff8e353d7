#include "audio/MpvAudioEngine.hpp"
#include "audio/NullAudioEngine.hpp"
#include "backend/SubsonicClient.hpp"
#include "config/AppConfig.hpp"
#include "fetch/FetchWorkerPool.hpp"
#include "session/SessionCoordinator.hpp"
#include "ui/TerminalUI.hpp"
#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

#ifndef HIGHPASS_VERSION
#define HIGHPASS_VERSION "0.0.0"
#endif

namespace {

struct Options {
    bool info     = false;
    bool debug    = false;
    bool forceRun = false;
    bool help     = false;
    std::string configPath;
};

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --config <path>  read configuration from path\n"
              << "  --debug          write a debug log\n"
              << "  --force-run      start even when not attached to a terminal\n"
              << "  --info           print version information and exit\n"
              << "  --help           show this message\n";
}

// Returns false on a malformed command line
bool parseArgs(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--info")           opts.info = true;
        else if (arg == "--debug")     opts.debug = true;
        else if (arg == "--force-run") opts.forceRun = true;
        else if (arg == "--help" || arg == "-h") opts.help = true;
        else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "highpass: --config needs a path\n";
                return false;
            }
            opts.configPath = argv[++i];
        } else {
            std::cerr << "highpass: unknown option " << arg << "\n";
            return false;
        }
    }
    return true;
}

void printInfo() {
    std::cout << "HighPass " << HIGHPASS_VERSION << "\n"
              << "  libmpv client API " << MpvAudioEngine::clientApiVersion() << "\n";

    MpvAudioEngine probe;
    if (probe.open()) {
        std::cout << "  " << probe.mpvVersion() << "\n";
        probe.close();
    } else {
        std::cout << "  mpv runtime unavailable\n";
    }

    std::cout << "  spdlog " << SPDLOG_VER_MAJOR << "." << SPDLOG_VER_MINOR
              << "." << SPDLOG_VER_PATCH << "\n"
              << "  nlohmann_json " << NLOHMANN_JSON_VERSION_MAJOR << "."
              << NLOHMANN_JSON_VERSION_MINOR << "." << NLOHMANN_JSON_VERSION_PATCH << "\n"
              << "  " << OpenSSL_version(OPENSSL_VERSION) << "\n";
}

// The terminal belongs to the UI, so logs only ever go to a file
void setupLogging(const LogConfig& log) {
    auto level = spdlog::level::from_str(log.level);
    if (level == spdlog::level::off) {
        spdlog::set_level(spdlog::level::off);
        return;
    }

    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log.file, 1048576 * 5, 3);  // 5MB, 3 files
    auto logger = std::make_shared<spdlog::logger>("highpass", fileSink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
}

}  // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage(argv[0]);
        return 2;
    }
    if (opts.help) {
        printUsage(argv[0]);
        return 0;
    }

    // Nothing may reach the terminal before the log file is set up
    spdlog::set_level(spdlog::level::off);

    if (opts.info) {
        printInfo();
        return 0;
    }

    loadDotEnv(".env");

    AppConfig config;
    try {
        config = AppConfig::load(opts.configPath);
    } catch (const ConfigError& e) {
        std::cerr << "highpass: " << e.what() << "\n";
        return 1;
    }
    if (opts.debug)
        config.log.level = "debug";

    try {
        setupLogging(config.log);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "highpass: cannot open log file " << config.log.file
                  << ": " << e.what() << "\n";
        return 1;
    }

    spdlog::info("HighPass v{} starting", HIGHPASS_VERSION);
    spdlog::info("Configuration: {}", config.sourcePath);

    if (!opts.forceRun && (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO))) {
        std::cerr << "highpass: not attached to a terminal (use --force-run to start anyway)\n";
        return 1;
    }

    // Audio engine; without libmpv the client still browses
    std::unique_ptr<IAudioEngine> engine;
    {
        auto mpv = std::make_unique<MpvAudioEngine>();
        if (mpv->open()) {
            engine = std::move(mpv);
        } else {
            spdlog::warn("libmpv unavailable, playback disabled");
            engine = std::make_unique<NullAudioEngine>();
        }
    }
    spdlog::info("Audio engine: {}", engine->backendName());

    auto service = std::make_shared<SubsonicClient>(config.subsonic, config.fetch);
    auto events  = std::make_shared<EventQueue>();

    FetchWorkerPool pool(service, events, static_cast<size_t>(config.fetch.maxConcurrent));
    SessionCoordinator coordinator(*service, *engine, events, config,
                                   [&pool](FetchJob job) {
                                       if (!pool.post(std::move(job)))
                                           spdlog::debug("Fetch pool closed, job dropped");
                                   });

    TerminalUI ui([events](InputIntent intent) { events->push(InputEvent{intent}); });
    coordinator.setFrameCallback([&ui](const Frame& f) { ui.present(f); });

    pool.start();
    std::thread sessionThread([&] {
        coordinator.start();
        coordinator.run();
        ui.exit();
    });

    ui.run();

    // The screen can also close on its own (Ctrl+C); make sure the loop ends
    events->push(InputEvent{InputIntent::Quit});
    sessionThread.join();

    // In-flight HTTP calls are not awaited
    size_t detached = pool.shutdown(true);
    engine.reset();     // joins the mpv event thread

    spdlog::info("HighPass exited cleanly");
    spdlog::default_logger()->flush();

    // Detached workers may still be inside httplib/OpenSSL and would race
    // static destruction (logger registry, OpenSSL cleanup)
    if (detached > 0)
        std::_Exit(0);
    return 0;
}
