#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace arena_tracker {

namespace zone_type {
constexpr const char* kHand = "ZoneType_Hand";
constexpr const char* kLibrary = "ZoneType_Library";
constexpr const char* kBattlefield = "ZoneType_Battlefield";
constexpr const char* kGraveyard = "ZoneType_Graveyard";
constexpr const char* kExile = "ZoneType_Exile";
constexpr const char* kStack = "ZoneType_Stack";
constexpr const char* kCommand = "ZoneType_Command";
constexpr const char* kLimbo = "ZoneType_Limbo";
constexpr const char* kUnknown = "unknown";
} // namespace zone_type

struct DeckCard {
    int grp_id = 0;
    int qty = 0;

    bool operator==(const DeckCard& other) const {
        return grp_id == other.grp_id && qty == other.qty;
    }
    nlohmann::json to_json() const { return {{"grpId", grp_id}, {"qty", qty}}; }
};

struct GameObjectInfo {
    int instance_id = 0;
    int grp_id = 0;
    int owner_seat_id = 0;
    int controller_seat_id = 0;
    int zone_id = 0;
    std::string visibility;
    std::vector<std::string> card_types;
    std::vector<std::string> subtypes;
    std::optional<std::string> name;   // often a numeric localisation id

    nlohmann::json to_json() const;
};

struct ZoneInfo {
    int zone_id = 0;
    std::string type;
    int owner_seat_id = 0;
    std::optional<std::vector<int>> object_instance_ids;

    nlohmann::json to_json() const;
};

struct TurnInfo {
    int turn_number = 0;
    int active_player = 0;
    std::string phase;
    std::string step;

    nlohmann::json to_json() const;
};

struct PlayerInfo {
    int seat_id = 0;
    int life_total = 0;
    std::optional<int> team_id;

    nlohmann::json to_json() const;
};

enum class MatchResult { Win, Loss, Draw };

const char* match_result_name(MatchResult result);

// ── Events ──────────────────────────────────────────────────────────────────

struct MatchStartEvent {
    static constexpr const char* kType = "match_start";
    std::string match_id;
    int player_seat_id = 1;
    int player_team_id = 1;
    std::optional<std::string> player_name;
    std::optional<std::string> opponent_name;
    std::optional<std::string> format;

    nlohmann::json to_json() const;
};

struct MatchCompleteEvent {
    static constexpr const char* kType = "match_complete";
    std::string match_id;
    MatchResult result = MatchResult::Draw;
    std::optional<int> winning_team_id;

    nlohmann::json to_json() const;
};

struct DeckSubmissionEvent {
    static constexpr const char* kType = "deck_submission";
    std::vector<DeckCard> deck_cards;
    std::vector<int> commander_grp_ids;
    std::vector<DeckCard> sideboard_cards;

    nlohmann::json to_json() const;
};

struct GameStateUpdateEvent {
    static constexpr const char* kType = "game_state_update";
    std::vector<GameObjectInfo> game_objects;
    std::vector<ZoneInfo> zones;
    std::optional<TurnInfo> turn_info;
    std::vector<PlayerInfo> players;

    nlohmann::json to_json() const;
};

struct MulliganPromptEvent {
    static constexpr const char* kType = "mulligan_prompt";
    int seat_id = 0;
    int mulligan_count = 0;
    std::vector<int> hand_grp_ids;   // empty until a later diff reveals the hand

    nlohmann::json to_json() const;
};

struct CardDrawnEvent {
    static constexpr const char* kType = "card_drawn";
    int instance_id = 0;
    int grp_id = 0;
    int owner_seat_id = 0;

    nlohmann::json to_json() const;
};

struct CardPlayedEvent {
    static constexpr const char* kType = "card_played";
    int instance_id = 0;
    int grp_id = 0;
    int owner_seat_id = 0;
    std::string from_zone_type;
    std::string to_zone_type;

    nlohmann::json to_json() const;
};

struct ZoneChangeEvent {
    static constexpr const char* kType = "zone_change";
    int instance_id = 0;
    int grp_id = 0;
    int owner_seat_id = 0;
    int from_zone_id = 0;
    int to_zone_id = 0;
    std::string from_zone_type;
    std::string to_zone_type;
    std::optional<std::string> category;   // Draw, CastSpell, Resolve, Destroy...

    nlohmann::json to_json() const;
};

struct LifeTotalChangeEvent {
    static constexpr const char* kType = "life_total_change";
    int seat_id = 0;
    int life_total = 0;

    nlohmann::json to_json() const;
};

struct TurnChangeEvent {
    static constexpr const char* kType = "turn_change";
    int turn_number = 0;
    int active_player = 0;

    nlohmann::json to_json() const;
};

struct PhaseChangeEvent {
    static constexpr const char* kType = "phase_change";
    std::string phase;
    std::string step;
    int turn_number = 0;

    nlohmann::json to_json() const;
};

struct DamageDealtEvent {
    static constexpr const char* kType = "damage_dealt";
    int source_instance_id = 0;
    int source_grp_id = 0;
    int amount = 0;
    std::optional<int> target_seat_id;
    std::optional<int> target_grp_id;

    nlohmann::json to_json() const;
};

struct IntermissionEvent {
    static constexpr const char* kType = "intermission";
    int game_number = 0;

    nlohmann::json to_json() const;
};

using ArenaGameEvent = std::variant<
    MatchStartEvent,
    MatchCompleteEvent,
    DeckSubmissionEvent,
    GameStateUpdateEvent,
    MulliganPromptEvent,
    CardDrawnEvent,
    CardPlayedEvent,
    ZoneChangeEvent,
    LifeTotalChangeEvent,
    TurnChangeEvent,
    PhaseChangeEvent,
    DamageDealtEvent,
    IntermissionEvent>;

const char* event_type_name(const ArenaGameEvent& event);
nlohmann::json event_to_json(const ArenaGameEvent& event);

} // namespace arena_tracker
