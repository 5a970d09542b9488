#pragma once

#include <string>
#include <functional>
#include <mutex>

namespace arena_tracker {

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

const char* log_level_name(LogLevel level);
LogLevel parse_log_level(const std::string& name);

// Process-wide log sink shared by the watcher, resolver and CLI
class TrackerLog {
public:
    using Sink = std::function<void(LogLevel level,
                                    const std::string& component,
                                    const std::string& message)>;

    static void set_sink(Sink sink);
    static void set_level(LogLevel level);
    static LogLevel level();

    static void debug(const std::string& component, const std::string& message);
    static void log(const std::string& component, const std::string& message);
    static void warn(const std::string& component, const std::string& message);
    static void error(const std::string& component, const std::string& message);

    // Default sink: "[HH:MM:SS] [Component] message", errors and warnings to cerr
    static void console_sink(LogLevel level, const std::string& component,
                             const std::string& message);

private:
    static void write(LogLevel level, const std::string& component, const std::string& message);

    static Sink sink_;
    static LogLevel min_level_;
    static std::mutex mutex_;
};

} // namespace arena_tracker
