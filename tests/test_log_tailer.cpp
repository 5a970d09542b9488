#include <catch2/catch_test_macros.hpp>
#include "log_tailer.hpp"
#include <filesystem>
#include <fstream>
#include <vector>

using namespace arena_tracker;

namespace {

void write_file(const std::string& path, const std::string& content, bool append = false) {
    std::ofstream out(path, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
    out << content;
}

struct Recorder {
    std::vector<std::string> chunks;
    std::vector<ResetReason> resets;

    void attach(LogTailer& tailer) {
        tailer.set_chunk_callback([this](const std::string& chunk) { chunks.push_back(chunk); });
        tailer.set_reset_callback([this](ResetReason reason) { resets.push_back(reason); });
    }
};

} // namespace

TEST_CASE("LogTailer delivers only appended bytes", "[tailer]") {
    std::string path = "/tmp/arena_tracker_test_tail.log";
    std::filesystem::remove(path);
    write_file(path, "existing line\n");

    LogTailer tailer(path);
    Recorder rec;
    rec.attach(tailer);
    tailer.start();

    SECTION("Start seeks to end") {
        REQUIRE(tailer.position().offset == 14);
        REQUIRE(tailer.poll() == PollStatus::NoChange);
        REQUIRE(rec.chunks.empty());
    }

    SECTION("Appended text arrives once") {
        write_file(path, "second\n", true);
        REQUIRE(tailer.poll() == PollStatus::NewData);
        REQUIRE(rec.chunks.size() == 1);
        REQUIRE(rec.chunks[0] == "second\n");

        REQUIRE(tailer.poll() == PollStatus::NoChange);
        REQUIRE(rec.chunks.size() == 1);
    }

    SECTION("Incomplete UTF-8 sequence is held back") {
        write_file(path, "caf\xC3", true);
        REQUIRE(tailer.poll() == PollStatus::NewData);
        REQUIRE(rec.chunks.size() == 1);
        REQUIRE(rec.chunks[0] == "caf");

        write_file(path, "\xA9\n", true);
        tailer.poll();
        REQUIRE(rec.chunks.size() == 2);
        REQUIRE(rec.chunks[1] == "\xC3\xA9\n");
    }

    SECTION("Truncation restarts from offset zero") {
        write_file(path, "new\n");
        REQUIRE(tailer.poll() == PollStatus::NewData);
        REQUIRE(rec.resets.size() == 1);
        REQUIRE(rec.resets[0] == ResetReason::Truncation);
        REQUIRE(rec.chunks.back() == "new\n");
        REQUIRE(tailer.position().offset == 4);
    }

    SECTION("Rotation restarts from offset zero") {
        std::string replacement = path + ".next";
        write_file(replacement, "rotated content that is longer than before\n");
        std::filesystem::rename(replacement, path);

        REQUIRE(tailer.poll() == PollStatus::NewData);
        REQUIRE(rec.resets.size() == 1);
        REQUIRE(rec.resets[0] == ResetReason::Rotation);
        REQUIRE(rec.chunks.back() == "rotated content that is longer than before\n");
    }

    SECTION("Stop is idempotent") {
        tailer.stop();
        tailer.stop();
        REQUIRE_FALSE(tailer.is_running());
        REQUIRE(tailer.position().offset == 0);
        REQUIRE_FALSE(tailer.position().identity.has_value());
        REQUIRE(tailer.poll() == PollStatus::NoChange);
    }

    tailer.stop();
    std::filesystem::remove(path);
}

TEST_CASE("LogTailer waits for a missing file", "[tailer]") {
    std::string path = "/tmp/arena_tracker_test_missing.log";
    std::filesystem::remove(path);

    LogTailer tailer(path);
    Recorder rec;
    rec.attach(tailer);
    tailer.start();

    REQUIRE(tailer.is_running());
    REQUIRE(tailer.poll() == PollStatus::FileMissing);

    write_file(path, "hello\n");
    REQUIRE(tailer.poll() == PollStatus::NewData);
    REQUIRE(rec.chunks.size() == 1);
    REQUIRE(rec.chunks[0] == "hello\n");
    REQUIRE(rec.resets.empty());

    tailer.stop();
    std::filesystem::remove(path);
}

TEST_CASE("LogTailer catch-up reads the trailing window", "[tailer]") {
    std::string path = "/tmp/arena_tracker_test_catchup.log";
    write_file(path, "0123456789abcdefghij");

    LogTailer tailer(path, true, 10);
    Recorder rec;
    rec.attach(tailer);
    tailer.start();

    REQUIRE(rec.chunks.size() == 1);
    REQUIRE(rec.chunks[0] == "abcdefghij");
    REQUIRE(tailer.position().offset == 20);
    REQUIRE(tailer.poll() == PollStatus::NoChange);

    tailer.stop();
    std::filesystem::remove(path);
}

TEST_CASE("incomplete_utf8_tail", "[tailer]") {
    REQUIRE(incomplete_utf8_tail("") == 0);
    REQUIRE(incomplete_utf8_tail("abc") == 0);
    REQUIRE(incomplete_utf8_tail("a\xC3\xA9") == 0);
    REQUIRE(incomplete_utf8_tail("a\xC3") == 1);
    REQUIRE(incomplete_utf8_tail("a\xE2\x82") == 2);
    REQUIRE(incomplete_utf8_tail("a\xF0\x9F\x98") == 3);
    REQUIRE(incomplete_utf8_tail("a\xF0\x9F\x98\x80") == 0);
}
