#pragma once

#include "card_lookup_client.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace arena_tracker {

struct DeckCardEntry {
    int grp_id = 0;
    int qty = 0;
    int remaining = 0;
    std::optional<ResolvedCard> card;

    nlohmann::json to_json() const;
};

// Live view of the current match, copied out to subscribers
struct GameStateSnapshot {
    std::optional<std::string> match_id;
    int game_number = 1;
    int player_seat_id = 1;
    std::optional<std::string> player_name;
    std::optional<std::string> opponent_name;
    std::optional<std::string> format;

    std::vector<DeckCardEntry> deck_list;
    std::vector<DeckCardEntry> sideboard_list;
    std::vector<int> commander_grp_ids;
    int library_size = 0;

    // Zone contents as grpIds
    std::vector<int> hand;
    std::vector<int> battlefield;
    std::vector<int> graveyard;
    std::vector<int> exile;
    std::vector<int> opponent_battlefield;
    std::vector<int> opponent_graveyard;

    int player_life = 20;
    int opponent_life = 20;

    int turn_number = 0;
    std::string phase;
    std::string step;
    int active_player = 0;

    std::vector<int> opponent_cards_seen;
    std::vector<int> cards_drawn;

    int mulligan_count = 0;
    std::vector<int> opening_hand;

    bool is_active = false;
    bool is_sideboarding = false;

    std::map<int, double> draw_probabilities;   // grpId -> P(next draw)

    const DeckCardEntry* find_deck_card(int grp_id) const;
    nlohmann::json to_json() const;
};

// Starting life for a format id: brawl 25, commander/edh 40, otherwise 20
int starting_life(const std::optional<std::string>& format);

// Any string that parses fully as a number is a localisation id, not a name
bool is_numeric_name(const std::string& name);

} // namespace arena_tracker
