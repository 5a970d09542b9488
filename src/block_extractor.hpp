#pragma once

#include "json_block.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace arena_tracker {

// Multi-line JSON is collected for at most this many continuation lines
constexpr std::size_t kMaxContinuationLines = 200;

// Extracts every tagged JSON block from log text. Recognises
//   ==> Method(id): {json}      <== Method(id): {json}
//   [Logger]==> Method {json}   [Logger]<== Method(id) + JSON on the next line
//   [Logger]{json}
//   bare {json} lines carrying a known top-level key
// Blocks that fail to parse are skipped.
std::vector<JsonBlock> extract_json_blocks(std::string_view text);

// True if a bare JSON object looks like Arena client traffic
bool has_recognised_key(const nlohmann::json& payload);

// Accumulates appended text and returns only blocks not returned before.
// Only newline-terminated lines are scanned; a trailing partial line waits
// for the next append, and so does a multi-line object still missing its
// closing brace.
class StreamingBlockExtractor {
public:
    static constexpr std::size_t kTrimThreshold = 500000;
    static constexpr std::size_t kTrimKeep = 250000;

    std::vector<JsonBlock> append(const std::string& text);
    void reset();

    std::size_t processed_count() const { return processed_; }
    std::size_t buffer_size() const { return buffer_.size(); }

private:
    std::string_view complete_lines() const;
    void trim();

    std::string buffer_;
    std::size_t processed_ = 0;
};

} // namespace arena_tracker
