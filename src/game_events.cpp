#include "game_events.hpp"

namespace arena_tracker {

namespace {

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json deck_json(const std::vector<DeckCard>& cards) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& card : cards) {
        arr.push_back(card.to_json());
    }
    return arr;
}

} // namespace

const char* match_result_name(MatchResult result) {
    switch (result) {
        case MatchResult::Win: return "win";
        case MatchResult::Loss: return "loss";
        case MatchResult::Draw: return "draw";
        default: return "draw";
    }
}

nlohmann::json GameObjectInfo::to_json() const {
    nlohmann::json j;
    j["instanceId"] = instance_id;
    j["grpId"] = grp_id;
    j["ownerSeatId"] = owner_seat_id;
    j["controllerSeatId"] = controller_seat_id;
    j["zoneId"] = zone_id;
    j["visibility"] = visibility;
    if (!card_types.empty()) j["cardTypes"] = card_types;
    if (!subtypes.empty()) j["subtypes"] = subtypes;
    if (name) j["name"] = *name;
    return j;
}

nlohmann::json ZoneInfo::to_json() const {
    nlohmann::json j;
    j["zoneId"] = zone_id;
    j["type"] = type;
    j["ownerSeatId"] = owner_seat_id;
    if (object_instance_ids) j["objectInstanceIds"] = *object_instance_ids;
    return j;
}

nlohmann::json TurnInfo::to_json() const {
    return {
        {"turnNumber", turn_number},
        {"activePlayer", active_player},
        {"phase", phase},
        {"step", step}
    };
}

nlohmann::json PlayerInfo::to_json() const {
    nlohmann::json j;
    j["seatId"] = seat_id;
    j["lifeTotal"] = life_total;
    if (team_id) j["teamId"] = *team_id;
    return j;
}

nlohmann::json MatchStartEvent::to_json() const {
    return {
        {"type", kType},
        {"matchId", match_id},
        {"playerSeatId", player_seat_id},
        {"playerTeamId", player_team_id},
        {"playerName", optional_json(player_name)},
        {"opponentName", optional_json(opponent_name)},
        {"format", optional_json(format)}
    };
}

nlohmann::json MatchCompleteEvent::to_json() const {
    return {
        {"type", kType},
        {"matchId", match_id},
        {"result", match_result_name(result)},
        {"winningTeamId", optional_json(winning_team_id)}
    };
}

nlohmann::json DeckSubmissionEvent::to_json() const {
    return {
        {"type", kType},
        {"deckCards", deck_json(deck_cards)},
        {"commanderGrpIds", commander_grp_ids},
        {"sideboardCards", deck_json(sideboard_cards)}
    };
}

nlohmann::json GameStateUpdateEvent::to_json() const {
    nlohmann::json j;
    j["type"] = kType;
    j["gameObjects"] = nlohmann::json::array();
    for (const auto& obj : game_objects) j["gameObjects"].push_back(obj.to_json());
    j["zones"] = nlohmann::json::array();
    for (const auto& zone : zones) j["zones"].push_back(zone.to_json());
    if (turn_info) j["turnInfo"] = turn_info->to_json();
    if (!players.empty()) {
        j["players"] = nlohmann::json::array();
        for (const auto& player : players) j["players"].push_back(player.to_json());
    }
    return j;
}

nlohmann::json MulliganPromptEvent::to_json() const {
    return {
        {"type", kType},
        {"seatId", seat_id},
        {"mulliganCount", mulligan_count},
        {"handGrpIds", hand_grp_ids}
    };
}

nlohmann::json CardDrawnEvent::to_json() const {
    return {
        {"type", kType},
        {"instanceId", instance_id},
        {"grpId", grp_id},
        {"ownerSeatId", owner_seat_id}
    };
}

nlohmann::json CardPlayedEvent::to_json() const {
    return {
        {"type", kType},
        {"instanceId", instance_id},
        {"grpId", grp_id},
        {"ownerSeatId", owner_seat_id},
        {"fromZoneType", from_zone_type},
        {"toZoneType", to_zone_type}
    };
}

nlohmann::json ZoneChangeEvent::to_json() const {
    nlohmann::json j = {
        {"type", kType},
        {"instanceId", instance_id},
        {"grpId", grp_id},
        {"ownerSeatId", owner_seat_id},
        {"fromZoneId", from_zone_id},
        {"toZoneId", to_zone_id},
        {"fromZoneType", from_zone_type},
        {"toZoneType", to_zone_type}
    };
    if (category) j["category"] = *category;
    return j;
}

nlohmann::json LifeTotalChangeEvent::to_json() const {
    return {{"type", kType}, {"seatId", seat_id}, {"lifeTotal", life_total}};
}

nlohmann::json TurnChangeEvent::to_json() const {
    return {{"type", kType}, {"turnNumber", turn_number}, {"activePlayer", active_player}};
}

nlohmann::json PhaseChangeEvent::to_json() const {
    return {{"type", kType}, {"phase", phase}, {"step", step}, {"turnNumber", turn_number}};
}

nlohmann::json DamageDealtEvent::to_json() const {
    nlohmann::json j = {
        {"type", kType},
        {"sourceInstanceId", source_instance_id},
        {"sourceGrpId", source_grp_id},
        {"amount", amount}
    };
    if (target_seat_id) j["targetSeatId"] = *target_seat_id;
    if (target_grp_id) j["targetGrpId"] = *target_grp_id;
    return j;
}

nlohmann::json IntermissionEvent::to_json() const {
    return {{"type", kType}, {"gameNumber", game_number}};
}

const char* event_type_name(const ArenaGameEvent& event) {
    return std::visit([](const auto& e) -> const char* { return e.kType; }, event);
}

nlohmann::json event_to_json(const ArenaGameEvent& event) {
    return std::visit([](const auto& e) { return e.to_json(); }, event);
}

} // namespace arena_tracker
