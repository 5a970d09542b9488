#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace arena_tracker {

// Device + inode pair; changes when the client rotates Player.log
struct FileIdentity {
    std::uint64_t device = 0;
    std::uint64_t inode = 0;

    bool operator==(const FileIdentity& other) const {
        return device == other.device && inode == other.inode;
    }
    bool operator!=(const FileIdentity& other) const { return !(*this == other); }
};

struct LogPosition {
    std::uint64_t offset = 0;
    std::optional<FileIdentity> identity;
};

enum class PollStatus {
    NoChange,
    NewData,
    FileMissing,
    Error
};

enum class ResetReason {
    Rotation,
    Truncation
};

const char* reset_reason_name(ResetReason reason);

// Poll-driven tail of an append-only text file. Every call to poll() stats the
// file and delivers exactly the bytes appended since the previous call.
class LogTailer {
public:
    using ChunkCallback = std::function<void(const std::string& chunk)>;
    using ResetCallback = std::function<void(ResetReason reason)>;

    static constexpr std::uint64_t kDefaultCatchUpWindow = 5 * 1024 * 1024;

    explicit LogTailer(std::string path, bool catch_up = false,
                       std::uint64_t catch_up_window = kDefaultCatchUpWindow);

    void set_chunk_callback(ChunkCallback callback) { on_chunk_ = std::move(callback); }
    void set_reset_callback(ResetCallback callback) { on_reset_ = std::move(callback); }

    // Records the current identity and seeks to end, or delivers the trailing
    // catch-up window first. A missing file is not an error here.
    void start();
    void stop();

    PollStatus poll();

    bool is_running() const { return running_; }
    const std::string& path() const { return path_; }
    const LogPosition& position() const { return position_; }
    const std::string& last_error() const { return last_error_; }

private:
    enum class StatResult { Ok, Missing, Failed };

    StatResult stat_file(std::uint64_t& size, FileIdentity& identity);
    bool read_range(std::uint64_t from, std::uint64_t to, std::string& out);
    void deliver(std::string bytes);
    void reset_position(ResetReason reason);

    std::string path_;
    bool catch_up_;
    std::uint64_t catch_up_window_;
    bool running_ = false;
    LogPosition position_;
    std::string pending_utf8_;
    std::string last_error_;
    ChunkCallback on_chunk_;
    ResetCallback on_reset_;
};

// Number of trailing bytes that form an incomplete UTF-8 sequence
std::size_t incomplete_utf8_tail(const std::string& bytes);

} // namespace arena_tracker
