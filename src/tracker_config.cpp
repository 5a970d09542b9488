#include "tracker_config.hpp"
#include <cstdlib>
#include <iostream>
#include <sys/stat.h>

namespace arena_tracker {

namespace {

constexpr const char* kArenaLogSubdir = "AppData/LocalLow/Wizards Of The Coast/MTGA/Player.log";

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

long parse_number(const std::string& option, const std::string& value) {
    try {
        size_t used = 0;
        long parsed = std::stol(value, &used);
        if (used != value.size() || parsed < 0) {
            throw ConfigError("Invalid value for " + option + ": " + value);
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        throw ConfigError("Invalid value for " + option + ": " + value);
    } catch (const std::out_of_range&) {
        throw ConfigError("Value out of range for " + option + ": " + value);
    }
}

} // namespace

std::string default_log_path() {
    if (auto path = env("ARENA_LOG_PATH")) return *path;
    if (auto profile = env("USERPROFILE")) return *profile + "/" + kArenaLogSubdir;
    if (auto home = env("HOME")) {
        // Steam Proton prefix when present, plain Wine prefix otherwise
        std::string proton = *home + "/.local/share/Steam/steamapps/compatdata/2141910/pfx/"
                             "drive_c/users/steamuser/" + kArenaLogSubdir;
        struct stat st;
        if (::stat(proton.c_str(), &st) == 0) return proton;
        return *home + "/.wine/drive_c/users/" + env("USER").value_or("steamuser") + "/" + kArenaLogSubdir;
    }
    return "Player.log";
}

TrackerConfig parse_args(int argc, char* argv[]) {
    TrackerConfig config;
    config.log_path = default_log_path();

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw ConfigError("Missing value for " + arg);
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        }
        else if (arg == "--log") {
            config.log_path = next();
        }
        else if (arg == "--db") {
            config.db_path = next();
        }
        else if (arg == "--poll-ms") {
            config.poll_interval = std::chrono::milliseconds(parse_number(arg, next()));
            if (config.poll_interval.count() == 0) throw ConfigError("--poll-ms must be positive");
        }
        else if (arg == "--catch-up") {
            config.catch_up = true;
        }
        else if (arg == "--catch-up-mb") {
            config.catch_up = true;
            config.catch_up_window = static_cast<std::uint64_t>(parse_number(arg, next())) * 1024 * 1024;
        }
        else if (arg == "--offline") {
            config.offline = true;
        }
        else if (arg == "--rate-limit-ms") {
            config.remote_interval = std::chrono::milliseconds(parse_number(arg, next()));
        }
        else if (arg == "--telemetry") {
            config.telemetry_path = next();
        }
        else if (arg == "--log-level") {
            std::string level = next();
            if (level != "debug" && level != "info" && level != "warn" && level != "error") {
                throw ConfigError("Unknown log level: " + level);
            }
            config.log_level = parse_log_level(level);
        }
        else {
            throw ConfigError("Unknown option: " + arg);
        }
    }

    return config;
}

void print_usage(const char* program) {
    std::cout << "Arena Tracker - live MTG Arena log decoder\n\n";
    std::cout << "Usage: " << program << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --log PATH           Player.log to follow (default: $ARENA_LOG_PATH or client default)\n";
    std::cout << "  --db PATH            SQLite card cache (default: arena_tracker.db)\n";
    std::cout << "  --poll-ms N          Poll interval in milliseconds (default: 500)\n";
    std::cout << "  --catch-up           Scan the tail of the log for a match in progress\n";
    std::cout << "  --catch-up-mb N      Catch-up window in MiB (default: 5, implies --catch-up)\n";
    std::cout << "  --offline            Never query Scryfall\n";
    std::cout << "  --rate-limit-ms N    Minimum spacing of Scryfall requests (default: 100)\n";
    std::cout << "  --telemetry PATH     Append telemetry batches as JSON lines (default: stdout)\n";
    std::cout << "  --log-level LEVEL    debug, info, warn or error (default: info)\n";
    std::cout << "  --help               Show this help message\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << program << " --catch-up --db cards.db --telemetry telemetry.jsonl\n";
}

} // namespace arena_tracker
