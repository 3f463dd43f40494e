#include "config.hpp"
#include "log.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "settings_source.hpp"

#include <curl/curl.h>
#include <filesystem>
#include <print>
#include <string>

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: holdtalk [options]");
            std::println("Options:");
            std::println("  -f, --foreground    Run in foreground (don't daemonize)");
            std::println("  -v, --verbose       Enable debug logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {} (see --help)", arg);
            return 1;
        }
    }

    if (config_path.empty()) config_path = Config::default_path();

    Config config;
    if (!config_path.empty() && std::filesystem::exists(config_path)) {
        config = Config::load(config_path);
    }

    if (!foreground) {
        platform::daemonize();
    }

    Logger log(verbose ? LogLevel::Debug : LogLevel::Info);
    log.info("starting (whisper: {} @ {}, llm: {})", config.whisper.api_format,
             config.whisper.url, to_string(config.provider));

    curl_global_init(CURL_GLOBAL_DEFAULT);
    LinuxEventLoop::block_signals();

    int rc = 0;
    {
        SettingsSource settings(std::move(config), config_path, log);
        LinuxEventLoop loop(settings, log);
        if (!loop.init()) {
            log.critical("failed to initialize");
            rc = 1;
        } else {
            loop.run();
        }
    }

    curl_global_cleanup();
    return rc;
}
