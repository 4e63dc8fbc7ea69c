#include "backend/CatalogService.hpp"
#include "backend/Config.hpp"
#include "server/HttpServer.hpp"
#include "util/Logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>

using namespace std::chrono_literals;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};

// Signal handler for graceful shutdown (Ctrl+C, kill, etc.)
static void signal_handler(int) {
    g_shutdown.store(true);
}

int main() {
    namespace fs = std::filesystem;
    using lorchestre::util::Logger;

    try {
        auto config = lorchestre::backend::ConfigLoader::load_config();
        Logger::init(config.log_file, Logger::parse_level(config.log_level), true);
        Logger::info("lorchestre v" LORCHESTRE_VERSION " starting...");

        // First run: leave a config file behind for the operator to edit
        auto config_file = lorchestre::backend::ConfigLoader::get_config_file();
        std::error_code ec;
        if (!fs::exists(config_file, ec)) {
            lorchestre::backend::ConfigLoader::save_config(config, config_file);
        }

        // Create cache directory if it doesn't exist
        fs::create_directories(config.cache_directory, ec);
        if (ec) {
            Logger::error("Cannot create cache directory " + config.cache_directory.string() + ": " + ec.message());
            return 1;
        }
        Logger::info("Music directory: " + config.music_directory.string());
        Logger::info("Cache directory: " + config.cache_directory.string());

        std::signal(SIGINT, signal_handler);   // Ctrl+C
        std::signal(SIGTERM, signal_handler);  // kill command
        std::signal(SIGPIPE, SIG_IGN);         // Clients hang up mid-stream

        lorchestre::backend::CatalogService service(config.music_directory, config.cache_directory);

        // Startup rebuild; the server still comes up on failure, serving an empty catalog
        try {
            auto report = service.rebuild();
            Logger::info("Startup rebuild: " + std::to_string(report.tracks) + " tracks, " +
                         std::to_string(report.diagnostics.size()) + " skipped");
        } catch (const std::exception& e) {
            Logger::error("Startup rebuild failed: " + std::string(e.what()));
        }

        lorchestre::server::HttpServer server(config.host, config.port, service);
        server.start();
        std::cout << "lorchestre daemon started on http://" << config.host << ":" << server.port() << std::endl;

        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(200ms);
        }

        Logger::info("Shutdown requested");
        server.stop();
        Logger::info("lorchestre stopped");
        return 0;
    } catch (const std::exception& e) {
        Logger::error(std::string("Fatal: ") + e.what());
        std::cerr << "lorchestre: " << e.what() << std::endl;
        return 1;
    }
}
