#include "log_tailer.hpp"
#include "tracker_log.hpp"
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <fstream>

namespace arena_tracker {

const char* reset_reason_name(ResetReason reason) {
    switch (reason) {
        case ResetReason::Rotation: return "rotation";
        case ResetReason::Truncation: return "truncation";
        default: return "unknown";
    }
}

std::size_t incomplete_utf8_tail(const std::string& bytes) {
    const std::size_t size = bytes.size();
    const std::size_t scan = size < 4 ? size : 4;

    for (std::size_t back = 1; back <= scan; ++back) {
        auto c = static_cast<unsigned char>(bytes[size - back]);
        if ((c & 0xC0) == 0x80) continue;  // continuation byte

        std::size_t expected = 1;
        if ((c & 0xE0) == 0xC0) expected = 2;
        else if ((c & 0xF0) == 0xE0) expected = 3;
        else if ((c & 0xF8) == 0xF0) expected = 4;

        return back < expected ? back : 0;
    }
    return 0;
}

LogTailer::LogTailer(std::string path, bool catch_up, std::uint64_t catch_up_window)
    : path_(std::move(path))
    , catch_up_(catch_up)
    , catch_up_window_(catch_up_window)
{
}

LogTailer::StatResult LogTailer::stat_file(std::uint64_t& size, FileIdentity& identity) {
    struct stat st {};
    if (::stat(path_.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            return StatResult::Missing;
        }
        last_error_ = "stat failed for " + path_ + ": " + std::strerror(errno);
        return StatResult::Failed;
    }
    size = static_cast<std::uint64_t>(st.st_size);
    identity.device = static_cast<std::uint64_t>(st.st_dev);
    identity.inode = static_cast<std::uint64_t>(st.st_ino);
    return StatResult::Ok;
}

bool LogTailer::read_range(std::uint64_t from, std::uint64_t to, std::string& out) {
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        last_error_ = "cannot open " + path_;
        return false;
    }

    out.resize(static_cast<std::size_t>(to - from));
    file.seekg(static_cast<std::streamoff>(from));
    file.read(&out[0], static_cast<std::streamsize>(out.size()));
    if (file.gcount() != static_cast<std::streamsize>(out.size())) {
        // File shrank between stat and read; keep whatever arrived
        out.resize(static_cast<std::size_t>(file.gcount()));
    }
    return true;
}

void LogTailer::deliver(std::string bytes) {
    if (!pending_utf8_.empty()) {
        bytes.insert(0, pending_utf8_);
        pending_utf8_.clear();
    }

    std::size_t tail = incomplete_utf8_tail(bytes);
    if (tail > 0) {
        pending_utf8_ = bytes.substr(bytes.size() - tail);
        bytes.resize(bytes.size() - tail);
    }

    if (!bytes.empty() && on_chunk_) {
        on_chunk_(bytes);
    }
}

void LogTailer::reset_position(ResetReason reason) {
    TrackerLog::log("LogTailer", std::string("Detected ") + reset_reason_name(reason) +
                    ", restarting from offset 0: " + path_);
    position_.offset = 0;
    pending_utf8_.clear();
    if (on_reset_) {
        on_reset_(reason);
    }
}

void LogTailer::start() {
    if (running_) return;
    running_ = true;
    position_ = LogPosition{};
    pending_utf8_.clear();

    std::uint64_t size = 0;
    FileIdentity identity;
    switch (stat_file(size, identity)) {
        case StatResult::Missing:
            TrackerLog::log("LogTailer", "Waiting for log file to appear: " + path_);
            return;
        case StatResult::Failed:
            TrackerLog::error("LogTailer", last_error_);
            return;
        case StatResult::Ok:
            break;
    }

    position_.identity = identity;

    if (catch_up_ && size > 0) {
        std::uint64_t window = size < catch_up_window_ ? size : catch_up_window_;
        std::string recent;
        if (read_range(size - window, size, recent)) {
            // Window may start inside a multibyte character
            std::size_t skip = 0;
            while (skip < recent.size() && (static_cast<unsigned char>(recent[skip]) & 0xC0) == 0x80) {
                ++skip;
            }
            TrackerLog::log("LogTailer", "Catch-up: scanning last " + std::to_string(window) +
                            " bytes of " + path_);
            position_.offset = size;
            deliver(recent.substr(skip));
            return;
        }
        TrackerLog::error("LogTailer", last_error_);
    }

    position_.offset = size;
    TrackerLog::log("LogTailer", "Started tailing: " + path_ + " at offset " + std::to_string(size));
}

void LogTailer::stop() {
    if (!running_) return;
    running_ = false;
    position_ = LogPosition{};
    pending_utf8_.clear();
    last_error_.clear();
    TrackerLog::log("LogTailer", "Stopped tailing: " + path_);
}

PollStatus LogTailer::poll() {
    if (!running_) return PollStatus::NoChange;

    std::uint64_t size = 0;
    FileIdentity identity;
    switch (stat_file(size, identity)) {
        case StatResult::Missing:
            return PollStatus::FileMissing;
        case StatResult::Failed:
            return PollStatus::Error;
        case StatResult::Ok:
            break;
    }

    if (position_.identity && *position_.identity != identity) {
        position_.identity = identity;
        reset_position(ResetReason::Rotation);
    } else if (!position_.identity) {
        position_.identity = identity;
    }

    if (size < position_.offset) {
        reset_position(ResetReason::Truncation);
    }

    if (size <= position_.offset) {
        return PollStatus::NoChange;
    }

    std::string chunk;
    if (!read_range(position_.offset, size, chunk)) {
        return PollStatus::Error;
    }

    position_.offset += chunk.size();
    deliver(std::move(chunk));
    return PollStatus::NewData;
}

} // namespace arena_tracker
