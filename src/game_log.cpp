#include "game_log.hpp"
#include <cstdlib>
#include <map>
#include <set>

namespace arena_tracker {

namespace {

template <typename T>
void put(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

const char* side_name(LogSide side) {
    return side == LogSide::Self ? "self" : "opponent";
}

LogSide side_of(int seat_id, const GameStateSnapshot& state) {
    return seat_id == state.player_seat_id ? LogSide::Self : LogSide::Opponent;
}

std::string seat_name(int seat_id, const GameStateSnapshot& state) {
    if (seat_id == state.player_seat_id) return state.player_name.value_or("You");
    return state.opponent_name.value_or("Opponent");
}

const std::map<std::string, std::string>& zone_change_verbs() {
    static const std::map<std::string, std::string> verbs = {
        {"Destroy", "destroyed"},
        {"Exile", "exiled"},
        {"Discard", "discarded"},
        {"Sacrifice", "sacrificed"},
        {"Counter", "countered"},
        {"Mill", "milled"},
        {"ReturnToHand", "returned"},
    };
    return verbs;
}

} // namespace

const char* game_log_type_name(GameLogType type) {
    switch (type) {
        case GameLogType::System: return "system";
        case GameLogType::Turn: return "turn";
        case GameLogType::Phase: return "phase";
        case GameLogType::Action: return "action";
        case GameLogType::Life: return "life";
        case GameLogType::Damage: return "damage";
        case GameLogType::Result: return "result";
        default: return "system";
    }
}

std::string GameLogEntry::display_text() const {
    if (repeat <= 1) return text;
    return text + " (x" + std::to_string(repeat) + ")";
}

nlohmann::json GameLogEntry::to_json() const {
    nlohmann::json j;
    j["type"] = game_log_type_name(type);
    j["text"] = display_text();
    j["player"] = player ? nlohmann::json(side_name(*player)) : nlohmann::json(nullptr);
    put(j, "turnNumber", turn_number);
    put(j, "cardName", card_name);
    put(j, "cardGrpId", card_grp_id);
    put(j, "targetCardName", target_card_name);
    put(j, "targetGrpId", target_grp_id);
    put(j, "amount", amount);
    put(j, "lifeBefore", life_before);
    put(j, "lifeAfter", life_after);
    put(j, "phase", phase);
    put(j, "verb", verb);
    if (player) j["isSelf"] = *player == LogSide::Self;
    if (repeat > 1) j["repeat"] = repeat;
    return j;
}

nlohmann::json LastMatchInfo::to_json() const {
    auto opt = [](const std::optional<std::string>& v) {
        return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
    };
    nlohmann::json j = {
        {"matchId", match_id},
        {"format", opt(format)},
        {"playerName", opt(player_name)},
        {"opponentName", opt(opponent_name)}
    };
    if (result) j["result"] = match_result_name(*result);
    return j;
}

int shared_turn(int raw_turn) {
    return (raw_turn + 1) / 2;
}

std::optional<std::string> phase_label(const std::string& phase, const std::string& step) {
    static const std::set<std::string> suppressed = {
        "Step_Upkeep", "Step_BeginCombat", "Step_EndCombat", "Step_Cleanup", "Step_Untap"
    };
    static const std::map<std::string, std::string> phases = {
        {"Phase_Main1", "Precombat Main"},
        {"Phase_Main2", "Postcombat Main"},
    };
    static const std::map<std::string, std::string> steps = {
        {"Step_Draw", "Draw Step"},
        {"Step_DeclareAttack", "Declare Attackers"},
        {"Step_DeclareBlock", "Declare Blockers"},
        {"Step_CombatDamage", "Combat Damage"},
        {"Step_End", "End Step"},
    };

    if (suppressed.count(step)) return std::nullopt;
    if (auto it = phases.find(phase); it != phases.end()) return it->second;
    if (auto it = steps.find(step); it != steps.end()) return it->second;
    return std::nullopt;
}

// ── History ─────────────────────────────────────────────────────────────────

void GameLog::add(GameLogEntry entry) {
    if (entry.type == GameLogType::Phase) {
        pending_phase_ = std::move(entry);
        return;
    }

    if (entry.type == GameLogType::Action || entry.type == GameLogType::Life ||
        entry.type == GameLogType::Damage) {
        flush_pending_phase();
    }

    // A new turn discards the label of a phase nothing happened in
    if (entry.type == GameLogType::Turn) {
        pending_phase_.reset();
    }

    if (!history_.empty()) {
        GameLogEntry& last = history_.back();
        if (last.type == entry.type && last.text == entry.text && last.player == entry.player) {
            last.repeat++;
            emit(last, true);
            return;
        }
    }

    history_.push_back(std::move(entry));
    emit(history_.back(), false);
}

void GameLog::flush_pending_phase() {
    if (!pending_phase_) return;
    history_.push_back(std::move(*pending_phase_));
    pending_phase_.reset();
    emit(history_.back(), false);
}

void GameLog::emit(const GameLogEntry& entry, bool collapsed) {
    if (listener_) listener_(entry, collapsed);
}

void GameLog::begin_match(const MatchStartEvent& event) {
    history_.clear();
    pending_phase_.reset();
    last_logged_turn_ = 0;
    last_logged_phase_.clear();
    last_match_ = LastMatchInfo{event.match_id, event.format, event.player_name, event.opponent_name, std::nullopt};

    GameLogEntry entry;
    entry.type = GameLogType::System;
    entry.text = event.format.value_or("Match") + ": " + event.player_name.value_or("You") +
                 " vs " + event.opponent_name.value_or("Opponent");
    add(std::move(entry));
}

// ── Narration ───────────────────────────────────────────────────────────────

void GameLog::record(const ArenaGameEvent& event, const GameStateSnapshot& before,
                     const GameStateSnapshot& after, const CardNamer& card_name) {
    auto name_of = [&card_name](int grp_id) -> std::string {
        std::optional<std::string> name;
        if (card_name) name = card_name(grp_id);
        return name ? *name : "Card #" + std::to_string(grp_id);
    };
    const int turn = shared_turn(before.turn_number);

    if (auto* e = std::get_if<MatchCompleteEvent>(&event)) {
        if (last_match_) last_match_->result = e->result;

        GameLogEntry entry;
        entry.type = GameLogType::Result;
        entry.verb = match_result_name(e->result);
        entry.player = e->result == MatchResult::Win ? LogSide::Self : LogSide::Opponent;
        if (e->result == MatchResult::Win) entry.text = "Victory!";
        else if (e->result == MatchResult::Loss) entry.text = "Defeat.";
        else entry.text = std::string("Result: ") + match_result_name(e->result);
        add(std::move(entry));
    } else if (auto* e = std::get_if<MulliganPromptEvent>(&event)) {
        std::string text = "Opening hand";
        if (e->mulligan_count > 0) text += " (mulligan " + std::to_string(e->mulligan_count) + ")";
        for (std::size_t i = 0; i < e->hand_grp_ids.size(); ++i) {
            text += (i == 0 ? ": " : ", ") + name_of(e->hand_grp_ids[i]);
        }

        GameLogEntry entry;
        entry.type = GameLogType::System;
        entry.text = std::move(text);
        entry.player = LogSide::Self;
        add(std::move(entry));
    } else if (auto* e = std::get_if<CardDrawnEvent>(&event)) {
        GameLogEntry entry;
        entry.type = GameLogType::Action;
        entry.verb = "drew";
        entry.turn_number = shared_turn(after.turn_number);
        entry.player = side_of(e->owner_seat_id, after);
        if (entry.player == LogSide::Self) {
            std::string name = name_of(e->grp_id);
            entry.text = seat_name(after.player_seat_id, after) + " drew " + name;
            entry.card_name = name;
            entry.card_grp_id = e->grp_id;
        } else {
            // Hidden information
            entry.text = seat_name(e->owner_seat_id, after) + " drew a card";
        }
        add(std::move(entry));
    } else if (auto* e = std::get_if<CardPlayedEvent>(&event)) {
        std::string name = name_of(e->grp_id);
        std::string verb = e->from_zone_type == zone_type::kHand && e->to_zone_type == zone_type::kBattlefield ? "played" : "cast";

        GameLogEntry entry;
        entry.type = GameLogType::Action;
        entry.player = side_of(e->owner_seat_id, after);
        entry.text = seat_name(e->owner_seat_id, after) + " " + verb + " " + name;
        entry.verb = verb;
        entry.card_name = name;
        entry.card_grp_id = e->grp_id;
        entry.turn_number = turn;
        add(std::move(entry));
    } else if (auto* e = std::get_if<LifeTotalChangeEvent>(&event)) {
        int previous = e->seat_id == before.player_seat_id ? before.player_life : before.opponent_life;
        int diff = e->life_total - previous;
        std::string label = seat_name(e->seat_id, after);

        GameLogEntry entry;
        entry.type = GameLogType::Life;
        entry.player = side_of(e->seat_id, after);
        entry.turn_number = turn;
        entry.life_after = e->life_total;
        if (diff != 0) {
            entry.amount = std::abs(diff);
            entry.life_before = previous;
            entry.text = label + (diff < 0 ? " took " + std::to_string(-diff) + " damage"
                                           : " gained " + std::to_string(diff) + " life") +
                         " (" + std::to_string(previous) + " -> " + std::to_string(e->life_total) + ")";
        } else {
            entry.text = label + "'s life is " + std::to_string(e->life_total);
        }
        add(std::move(entry));
    } else if (auto* e = std::get_if<TurnChangeEvent>(&event)) {
        if (e->turn_number == last_logged_turn_) return;
        last_logged_turn_ = e->turn_number;
        last_logged_phase_.clear();

        GameLogEntry entry;
        entry.type = GameLogType::Turn;
        entry.player = side_of(e->active_player, after);
        entry.turn_number = shared_turn(e->turn_number);
        entry.text = "Turn " + std::to_string(*entry.turn_number) + ": " + seat_name(e->active_player, after);
        add(std::move(entry));
    } else if (auto* e = std::get_if<PhaseChangeEvent>(&event)) {
        auto label = phase_label(e->phase, e->step);
        if (!label || *label == last_logged_phase_) return;
        last_logged_phase_ = *label;

        GameLogEntry entry;
        entry.type = GameLogType::Phase;
        entry.text = *label;
        entry.phase = e->step.empty() ? e->phase : e->step;
        entry.turn_number = shared_turn(after.turn_number);
        add(std::move(entry));
    } else if (auto* e = std::get_if<ZoneChangeEvent>(&event)) {
        // Draws, casts and resolutions are narrated by card_drawn/card_played
        if (!e->category) return;
        auto verb = zone_change_verbs().find(*e->category);
        if (verb == zone_change_verbs().end()) return;

        std::string name = name_of(e->grp_id);
        GameLogEntry entry;
        entry.type = GameLogType::Action;
        entry.player = side_of(e->owner_seat_id, after);
        entry.verb = verb->second;
        entry.card_name = name;
        entry.card_grp_id = e->grp_id;
        entry.turn_number = shared_turn(after.turn_number);
        if (*e->category == "Discard" || *e->category == "Sacrifice") {
            entry.text = seat_name(e->owner_seat_id, after) + " " + verb->second + " " + name;
        } else {
            entry.text = name + " was " + verb->second;
        }
        add(std::move(entry));
    } else if (auto* e = std::get_if<DamageDealtEvent>(&event)) {
        std::string source = name_of(e->source_grp_id);

        GameLogEntry entry;
        entry.type = GameLogType::Damage;
        entry.card_name = source;
        entry.card_grp_id = e->source_grp_id;
        entry.amount = e->amount;
        entry.turn_number = shared_turn(after.turn_number);
        if (e->target_seat_id) {
            std::string target = seat_name(*e->target_seat_id, after);
            // Attributed to whoever dealt it
            entry.player = side_of(*e->target_seat_id, after) == LogSide::Self ? LogSide::Opponent : LogSide::Self;
            entry.target_card_name = target;
            entry.text = source + " dealt " + std::to_string(e->amount) + " damage to " + target;
        } else if (e->target_grp_id) {
            std::string target = name_of(*e->target_grp_id);
            entry.target_card_name = target;
            entry.target_grp_id = *e->target_grp_id;
            entry.text = source + " dealt " + std::to_string(e->amount) + " damage to " + target;
        } else {
            return;
        }
        add(std::move(entry));
    }
}

} // namespace arena_tracker
