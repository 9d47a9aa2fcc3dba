#include "backend/AudioTagStore.hpp"
#include "backend/Config.hpp"
#include "core/ReconciliationEngine.hpp"
#include "net/HttpClient.hpp"
#include "provider/ProviderFactory.hpp"
#include "util/Logger.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>
#include <stop_token>
#include <thread>

using namespace std::chrono_literals;

// Global shutdown flag, set from the signal handler
static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

static void log_settings(const lyricflow::backend::Config& cfg) {
    using lyricflow::util::Logger;
    auto flag = [](bool b) { return b ? "true" : "false"; };

    for (const auto& root : cfg.music_paths) {
        Logger::info("Music path: " + root.string());
    }
    Logger::info(std::string("Provider: ") + lyricflow::backend::ConfigLoader::provider_name(cfg.provider));
    Logger::info(std::string("Download lyrics: ") + flag(cfg.download_lyrics) +
                 ", covers: " + flag(cfg.download_cover));
    Logger::info(std::string("Overwrite lyrics: ") + flag(cfg.overwrite_lyrics) +
                 ", covers: " + flag(cfg.overwrite_cover));
    Logger::info(std::string("Embed lyrics: ") + flag(cfg.update_lyrics) +
                 ", covers: " + flag(cfg.update_cover) + ", basic info: " + flag(cfg.update_basic_info));
    Logger::info("Workers: " + std::to_string(cfg.workers));
}

int main() {
    using lyricflow::util::Logger;

    Logger::init(Logger::Level::Info);
    Logger::info("lyricflow starting...");

    lyricflow::backend::Config config;
    try {
        config = lyricflow::backend::ConfigLoader::load();
    } catch (const lyricflow::backend::ConfigError& e) {
        Logger::error("Configuration error: " + std::string(e.what()));
        return 1;
    }

    Logger::init(Logger::parse_level(config.log_level, Logger::Level::Info), config.log_file);
    log_settings(config);

    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // docker stop, kill

    try {
        lyricflow::net::CurlHttpClient http(lyricflow::provider::http_options_from(config));
        auto provider = lyricflow::provider::make_provider(config, http);
        lyricflow::backend::AudioTagStore tags;
        lyricflow::core::ReconciliationEngine engine(
            lyricflow::core::EngineOptions::from_config(config), *provider, tags);

        std::stop_source stop;
        std::mutex sleep_mutex;
        std::condition_variable_any sleep_cv;

        // Signal handlers can only set a flag; this turns it into a stop request
        std::jthread shutdown_watcher([&stop](std::stop_token st) {
            while (!st.stop_requested()) {
                if (g_shutdown.load()) {
                    Logger::info("Shutdown requested, finishing running tracks...");
                    stop.request_stop();
                    return;
                }
                std::this_thread::sleep_for(100ms);
            }
        });

        while (true) {
            auto summary = engine.run(config.music_paths, stop.get_token());
            lyricflow::core::ReconciliationEngine::log_summary(summary);

            if (config.scan_interval_days <= 0 || stop.stop_requested()) {
                break;
            }

            Logger::info("Next scan in " + std::to_string(config.scan_interval_days) + " day(s)");
            std::unique_lock<std::mutex> lock(sleep_mutex);
            sleep_cv.wait_for(lock, stop.get_token(), std::chrono::hours(24) * config.scan_interval_days,
                              [] { return false; });
            if (stop.stop_requested()) {
                break;
            }
        }

        shutdown_watcher.request_stop();
    } catch (const std::exception& e) {
        Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    Logger::info("lyricflow shutdown");
    return 0;
}
