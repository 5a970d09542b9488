#include "block_extractor.hpp"
#include "tracker_log.hpp"
#include <array>
#include <optional>
#include <regex>

namespace arena_tracker {

namespace {

// Applied to the text before the first '{' only, so long JSON lines never
// go through the regex engine.
const std::regex& method_prefix_pattern() {
    static const std::regex pattern(R"((?:==>|<==)\s*([A-Za-z_][\w.]*)\s*(?:\([^)]*\))?\s*:?\s*$)");
    return pattern;
}

const std::regex& logger_prefix_pattern() {
    static const std::regex pattern(R"(\[[^\]]+\]\s*$)");
    return pattern;
}

constexpr std::size_t kMaxPrefixLength = 512;

const std::array<const char*, 6> kRecognisedKeys = {
    "greToClientEvent",
    "matchGameRoomStateChangedEvent",
    "authenticateResponse",
    "screenName",
    "matchId",
    "gameStateMessage",
};

// String-aware brace depth tracking that survives line breaks
class BraceScanner {
public:
    // Returns the index one past the closing brace when the object closes
    // inside this fragment, npos otherwise.
    std::size_t feed(std::string_view fragment) {
        for (std::size_t i = 0; i < fragment.size(); ++i) {
            char c = fragment[i];
            if (in_string_) {
                if (escaped_) {
                    escaped_ = false;
                } else if (c == '\\') {
                    escaped_ = true;
                } else if (c == '"') {
                    in_string_ = false;
                }
                continue;
            }
            if (c == '"') {
                in_string_ = true;
            } else if (c == '{') {
                ++depth_;
            } else if (c == '}') {
                if (--depth_ == 0) {
                    return i + 1;
                }
            }
        }
        return std::string_view::npos;
    }

private:
    int depth_ = 0;
    bool in_string_ = false;
    bool escaped_ = false;
};

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

std::string_view trim_left(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
    return s.substr(i);
}

enum class Collected { Complete, NeedMoreInput, TooLong };

// Collects a JSON object starting at `first` (which begins with '{') and
// continuing over lines[next...]. On success `consumed` is the number of
// continuation lines used.
Collected collect_json(std::string_view first, const std::vector<std::string_view>& lines,
                       std::size_t next, std::string& out, std::size_t& consumed) {
    BraceScanner scanner;
    std::size_t end = scanner.feed(first);
    if (end != std::string_view::npos) {
        out.assign(first.substr(0, end));
        consumed = 0;
        return Collected::Complete;
    }

    out.assign(first);
    std::size_t n = 0;
    for (; n < kMaxContinuationLines && next + n < lines.size(); ++n) {
        std::string_view line = lines[next + n];
        out += '\n';
        end = scanner.feed(line);
        if (end != std::string_view::npos) {
            out.append(line.substr(0, end));
            consumed = n + 1;
            return Collected::Complete;
        }
        out.append(line);
    }
    return n == kMaxContinuationLines ? Collected::TooLong : Collected::NeedMoreInput;
}

void attach_parsed_request(nlohmann::json& payload) {
    if (!payload.is_object()) return;
    auto it = payload.find("request");
    if (it == payload.end() || !it->is_string()) return;

    auto parsed = nlohmann::json::parse(it->get<std::string>(), nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        payload["_parsed_request"] = std::move(parsed);
    }
}

std::optional<nlohmann::json> parse_object(const std::string& text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    attach_parsed_request(parsed);
    return parsed;
}

bool is_recognised(const nlohmann::json& payload) {
    for (const char* key : kRecognisedKeys) {
        if (payload.contains(key)) return true;
    }
    return false;
}

std::vector<JsonBlock> scan_blocks(std::string_view text, bool stop_at_unfinished) {
    std::vector<JsonBlock> blocks;
    const auto lines = split_lines(text);
    std::size_t dropped = 0;

    std::size_t i = 0;
    while (i < lines.size()) {
        std::string_view line = lines[i];
        std::size_t brace = line.find('{');
        std::string_view prefix = line.substr(0, brace == std::string_view::npos ? line.size() : brace);

        if (prefix.size() > kMaxPrefixLength) {
            ++i;
            continue;
        }

        std::string prefix_str(prefix);
        std::smatch match;
        bool is_method = std::regex_search(prefix_str, match, method_prefix_pattern());
        std::string method = is_method ? match[1].str() : std::string();

        // "<== Method(id)" with the payload on the following line
        std::size_t json_line = i;
        std::string_view fragment;
        if (brace != std::string_view::npos) {
            fragment = line.substr(brace);
        } else if (is_method && i + 1 < lines.size() && trim_left(lines[i + 1]).substr(0, 1) == "{") {
            json_line = i + 1;
            fragment = trim_left(lines[i + 1]);
        } else {
            ++i;
            continue;
        }

        bool is_logger = !is_method && std::regex_search(prefix_str, logger_prefix_pattern());
        bool is_bare = !is_method && !is_logger && trim_left(prefix).empty();
        if (!is_method && !is_logger && !is_bare) {
            ++i;
            continue;
        }

        std::string json_text;
        std::size_t consumed = 0;
        Collected collected = collect_json(fragment, lines, json_line + 1, json_text, consumed);
        if (collected == Collected::NeedMoreInput && stop_at_unfinished) {
            // The rest of this object has not been written yet. Its inner
            // lines must not be mistaken for blocks of their own.
            break;
        }
        if (collected != Collected::Complete) {
            ++i;
            continue;
        }

        auto payload = parse_object(json_text);
        if (!payload) {
            ++dropped;
            ++i;
            continue;
        }

        if (is_method) {
            blocks.push_back(MethodBlock{method, std::move(*payload)});
        } else if (is_logger || is_recognised(*payload)) {
            blocks.push_back(StandaloneBlock{std::move(*payload)});
        } else {
            ++i;
            continue;
        }

        i = json_line + consumed + 1;
    }

    if (dropped > 0) {
        TrackerLog::debug("BlockExtractor", "Dropped " + std::to_string(dropped) + " malformed JSON block(s)");
    }
    return blocks;
}

} // namespace

bool has_recognised_key(const nlohmann::json& payload) {
    return payload.is_object() && is_recognised(payload);
}

std::vector<JsonBlock> extract_json_blocks(std::string_view text) {
    return scan_blocks(text, false);
}

std::string_view StreamingBlockExtractor::complete_lines() const {
    std::size_t last_newline = buffer_.rfind('\n');
    if (last_newline == std::string::npos) {
        return std::string_view();
    }
    return std::string_view(buffer_).substr(0, last_newline + 1);
}

std::vector<JsonBlock> StreamingBlockExtractor::append(const std::string& text) {
    buffer_ += text;

    std::vector<JsonBlock> fresh;
    std::string_view scannable = complete_lines();
    if (!scannable.empty()) {
        auto all = scan_blocks(scannable, true);
        if (all.size() > processed_) {
            fresh.reserve(all.size() - processed_);
            for (std::size_t i = processed_; i < all.size(); ++i) {
                fresh.push_back(std::move(all[i]));
            }
        }
        processed_ = all.size();
    }

    if (buffer_.size() > kTrimThreshold) {
        trim();
    }
    return fresh;
}

void StreamingBlockExtractor::trim() {
    std::size_t cut = buffer_.size() - kTrimKeep;
    std::size_t newline = buffer_.find('\n', cut);
    cut = newline == std::string::npos ? cut : newline + 1;
    buffer_.erase(0, cut);

    std::string_view scannable = complete_lines();
    processed_ = scannable.empty() ? 0 : scan_blocks(scannable, true).size();
    TrackerLog::debug("BlockExtractor", "Trimmed streaming buffer to " + std::to_string(buffer_.size()) +
                      " bytes, " + std::to_string(processed_) + " block(s) already processed");
}

void StreamingBlockExtractor::reset() {
    buffer_.clear();
    processed_ = 0;
}

} // namespace arena_tracker
