#include "tracker_log.hpp"
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace arena_tracker {

TrackerLog::Sink TrackerLog::sink_ = TrackerLog::console_sink;
LogLevel TrackerLog::min_level_ = LogLevel::Info;
std::mutex TrackerLog::mutex_;

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        default: return "unknown";
    }
}

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void TrackerLog::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink ? std::move(sink) : console_sink;
}

void TrackerLog::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel TrackerLog::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void TrackerLog::debug(const std::string& component, const std::string& message) {
    write(LogLevel::Debug, component, message);
}

void TrackerLog::log(const std::string& component, const std::string& message) {
    write(LogLevel::Info, component, message);
}

void TrackerLog::warn(const std::string& component, const std::string& message) {
    write(LogLevel::Warn, component, message);
}

void TrackerLog::error(const std::string& component, const std::string& message) {
    write(LogLevel::Error, component, message);
}

void TrackerLog::write(LogLevel level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(min_level_)) return;
    if (sink_) {
        sink_(level, component, message);
    }
}

void TrackerLog::console_sink(LogLevel level, const std::string& component,
                              const std::string& message) {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream line;
    line << "[" << std::put_time(&local, "%H:%M:%S") << "] [" << component << "] " << message;

    if (level == LogLevel::Warn || level == LogLevel::Error) {
        std::cerr << line.str() << std::endl;
    } else {
        std::cout << line.str() << std::endl;
    }
}

} // namespace arena_tracker
