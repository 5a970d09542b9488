#pragma once

#include "tracker_log.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace arena_tracker {

struct TrackerConfig {
    std::string log_path;
    std::string db_path = "arena_tracker.db";
    std::chrono::milliseconds poll_interval{500};
    bool catch_up = false;
    std::uint64_t catch_up_window = 5 * 1024 * 1024;
    bool offline = false;                              // no remote card lookups
    std::chrono::milliseconds remote_interval{100};
    std::optional<std::string> telemetry_path;         // JSON lines; stdout when unset
    LogLevel log_level = LogLevel::Info;
    bool show_help = false;
};

// Thrown for unusable command-line input
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Player.log location: $ARENA_LOG_PATH, else the client's default under
// $USERPROFILE (Windows) or the Wine/Proton prefix under $HOME.
std::string default_log_path();

TrackerConfig parse_args(int argc, char* argv[]);

void print_usage(const char* program);

} // namespace arena_tracker
