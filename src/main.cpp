#include "arena_log_watcher.hpp"
#include "grp_id_resolver.hpp"
#include "scryfall_client.hpp"
#include "sqlite_adapter.hpp"
#include "tracker_config.hpp"
#include "tracker_log.hpp"

#include <iostream>
#include <fstream>
#include <csignal>
#include <atomic>
#include <string>
#include <thread>

using namespace arena_tracker;

std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

int main(int argc, char* argv[]) {
    TrackerConfig config;
    try {
        config = parse_args(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    TrackerLog::set_level(config.log_level);

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        std::cout << "=== Arena Tracker ===" << std::endl;
        std::cout << "Log:      " << config.log_path << std::endl;
        std::cout << "Database: " << config.db_path << std::endl;

        auto db = std::make_shared<SqliteAdapter>(config.db_path);
        std::shared_ptr<CardLookupClient> remote;
        if (!config.offline) {
            remote = std::make_shared<ScryfallClient>();
        }
        auto resolver = std::make_shared<GrpIdResolver>(db, remote, config.remote_interval);

        std::ofstream telemetry_file;
        if (config.telemetry_path) {
            telemetry_file.open(*config.telemetry_path, std::ios::app);
            if (!telemetry_file) {
                throw std::runtime_error("Cannot open telemetry output: " + *config.telemetry_path);
            }
        }
        std::ostream& telemetry_out = config.telemetry_path ? telemetry_file : std::cout;

        WatcherCallbacks callbacks;
        callbacks.on_match = [](const ArenaMatch& match) {
            TrackerLog::log("Main", "Match record: " + match.to_json().dump());
        };
        callbacks.on_collection = [](const CardCollection& collection) {
            TrackerLog::log("Main", "Collection update: " + std::to_string(collection.size()) + " cards");
        };
        callbacks.on_telemetry_flush = [&telemetry_out](const TelemetryFlush& batch) {
            telemetry_out << batch.to_json().dump() << std::endl;
        };
        callbacks.on_game_log = [](const GameLogEntry& entry) {
            TrackerLog::log("Game", entry.display_text());
        };
        callbacks.on_game_log_update = callbacks.on_game_log;
        callbacks.on_error = [](const std::string& message) {
            std::cerr << "[Main] Watcher error: " << message << std::endl;
        };

        WatcherOptions options;
        options.log_path = config.log_path;
        options.poll_interval = config.poll_interval;
        options.catch_up = config.catch_up;
        options.catch_up_window = config.catch_up_window;

        ArenaLogWatcher watcher(options, callbacks);
        watcher.set_resolver(resolver);
        watcher.start();

        std::cout << "\nTracker ready. Press Ctrl+C to stop.\n" << std::endl;

        // Main loop
        while (running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        std::cout << "\n[Main] Shutting down..." << std::endl;
        watcher.stop();

        std::cout << "[Main] Shutdown complete. Matches recorded: " << watcher.match_count()
                  << ", cards cached: " << resolver->cache_size() << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
