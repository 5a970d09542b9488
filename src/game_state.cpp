#include "game_state.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace arena_tracker {

namespace {

nlohmann::json entries_json(const std::vector<DeckCardEntry>& entries) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& entry : entries) {
        arr.push_back(entry.to_json());
    }
    return arr;
}

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

nlohmann::json DeckCardEntry::to_json() const {
    return {
        {"grpId", grp_id},
        {"qty", qty},
        {"remaining", remaining},
        {"card", card ? card->to_json() : nlohmann::json(nullptr)}
    };
}

const DeckCardEntry* GameStateSnapshot::find_deck_card(int grp_id) const {
    for (const auto& entry : deck_list) {
        if (entry.grp_id == grp_id) return &entry;
    }
    return nullptr;
}

nlohmann::json GameStateSnapshot::to_json() const {
    nlohmann::json probs = nlohmann::json::object();
    for (const auto& [grp_id, p] : draw_probabilities) {
        probs[std::to_string(grp_id)] = p;
    }

    nlohmann::json j;
    j["matchId"] = optional_json(match_id);
    j["gameNumber"] = game_number;
    j["playerSeatId"] = player_seat_id;
    j["playerName"] = optional_json(player_name);
    j["opponentName"] = optional_json(opponent_name);
    j["format"] = optional_json(format);
    j["deckList"] = entries_json(deck_list);
    j["sideboardList"] = entries_json(sideboard_list);
    j["commanderGrpIds"] = commander_grp_ids;
    j["librarySize"] = library_size;
    j["hand"] = hand;
    j["battlefield"] = battlefield;
    j["graveyard"] = graveyard;
    j["exile"] = exile;
    j["opponentBattlefield"] = opponent_battlefield;
    j["opponentGraveyard"] = opponent_graveyard;
    j["playerLife"] = player_life;
    j["opponentLife"] = opponent_life;
    j["turnNumber"] = turn_number;
    j["phase"] = phase;
    j["step"] = step;
    j["activePlayer"] = active_player;
    j["opponentCardsSeen"] = opponent_cards_seen;
    j["cardsDrawn"] = cards_drawn;
    j["mulliganCount"] = mulligan_count;
    j["openingHand"] = opening_hand;
    j["isActive"] = is_active;
    j["isSideboarding"] = is_sideboarding;
    j["drawProbabilities"] = probs;
    return j;
}

int starting_life(const std::optional<std::string>& format) {
    if (!format) return 20;
    std::string f = *format;
    std::transform(f.begin(), f.end(), f.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // Brawl is 25 in both Historic and Standard
    if (f.find("brawl") != std::string::npos) return 25;
    if (f.find("commander") != std::string::npos || f.find("edh") != std::string::npos) return 40;
    return 20;
}

bool is_numeric_name(const std::string& name) {
    if (name.empty()) return false;
    char* end = nullptr;
    std::strtod(name.c_str(), &end);
    return end && *end == '\0';
}

} // namespace arena_tracker
