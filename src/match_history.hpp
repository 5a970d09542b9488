#pragma once

#include "game_events.hpp"
#include "json_block.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace arena_tracker {

struct SubmittedCard {
    std::string id;
    int qty = 1;
};

// Completed match as reconstructed from a whole log, without live state
struct ArenaMatch {
    std::string match_id;
    std::optional<std::string> player_name;
    std::optional<std::string> opponent_name;
    MatchResult result = MatchResult::Draw;
    std::optional<std::string> format;
    int turns = 0;
    std::optional<std::vector<SubmittedCard>> deck_cards;
    std::vector<std::string> cards_played;
    std::vector<std::string> opponent_cards_seen;

    nlohmann::json to_json() const;
};

// arena id -> owned quantity
using CardCollection = std::map<std::string, int>;

struct ArenaLogResult {
    std::vector<ArenaMatch> matches;
    std::optional<CardCollection> collection;
};

// Builds match records from blocks as they arrive. Only the aggregate of the
// match in progress is kept between calls.
class MatchHistoryParser {
public:
    // Matches completed by these blocks
    std::vector<ArenaMatch> feed(const std::vector<JsonBlock>& blocks);
    void reset();

    bool in_match() const { return current_.has_value(); }

private:
    struct InProgress {
        ArenaMatch match;
    };

    void add_game_state(const nlohmann::json& gsm);

    std::optional<std::vector<SubmittedCard>> deck_;
    std::optional<std::string> player_name_;
    std::optional<InProgress> current_;
};

std::vector<ArenaMatch> extract_matches(const std::vector<JsonBlock>& blocks);

// Last PlayerInventory.GetPlayerCardsV3 payload with at least one numeric key
std::optional<CardCollection> extract_collection(const std::vector<JsonBlock>& blocks);

ArenaLogResult parse_arena_log(std::string_view text);

} // namespace arena_tracker
