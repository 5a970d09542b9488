#include "game_state_engine.hpp"
#include "tracker_log.hpp"
#include <algorithm>
#include <type_traits>

namespace arena_tracker {

void GameStateEngine::process_event(const ArenaGameEvent& event) {
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, MatchStartEvent>) on_match_start(e);
        else if constexpr (std::is_same_v<T, DeckSubmissionEvent>) on_deck_submission(e);
        else if constexpr (std::is_same_v<T, GameStateUpdateEvent>) on_game_state(e);
        else if constexpr (std::is_same_v<T, MulliganPromptEvent>) on_mulligan(e);
        else if constexpr (std::is_same_v<T, CardDrawnEvent>) on_card_drawn(e);
        else if constexpr (std::is_same_v<T, CardPlayedEvent>) on_card_played(e);
        else if constexpr (std::is_same_v<T, ZoneChangeEvent>) on_zone_change(e);
        else if constexpr (std::is_same_v<T, LifeTotalChangeEvent>) on_life_change(e);
        else if constexpr (std::is_same_v<T, TurnChangeEvent>) on_turn_change(e);
        else if constexpr (std::is_same_v<T, PhaseChangeEvent>) on_phase_change(e);
        else if constexpr (std::is_same_v<T, IntermissionEvent>) on_intermission(e);
        else if constexpr (std::is_same_v<T, MatchCompleteEvent>) on_match_complete(e);
        // damage_dealt is informational; life moves through life_total_change
    }, event);

    update_draw_probabilities();
    notify();
}

void GameStateEngine::process_events(const std::vector<ArenaGameEvent>& events) {
    for (const auto& event : events) {
        process_event(event);
    }
}

GameStateEngine::ListenerId GameStateEngine::subscribe(Listener listener) {
    ListenerId id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void GameStateEngine::unsubscribe(ListenerId id) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [id](const auto& entry) { return entry.first == id; }),
                     listeners_.end());
}

void GameStateEngine::reset() {
    state_ = GameStateSnapshot{};
    clear_tracking();
    notify();
}

void GameStateEngine::resolve_card(int grp_id, const ResolvedCard& card) {
    for (auto* list : {&state_.deck_list, &state_.sideboard_list}) {
        for (auto& entry : *list) {
            if (entry.grp_id == grp_id && !entry.card) {
                entry.card = card;
            }
        }
    }
}

// ── Event handlers ──────────────────────────────────────────────────────────

void GameStateEngine::on_match_start(const MatchStartEvent& e) {
    state_ = GameStateSnapshot{};
    clear_tracking();

    state_.match_id = e.match_id;
    state_.player_seat_id = e.player_seat_id;
    state_.player_name = e.player_name;
    state_.opponent_name = e.opponent_name;
    state_.format = e.format;
    state_.is_active = true;

    int life = starting_life(e.format);
    state_.player_life = life;
    state_.opponent_life = life;
}

void GameStateEngine::on_deck_submission(const DeckSubmissionEvent& e) {
    auto to_entries = [](const std::vector<DeckCard>& cards) {
        std::vector<DeckCardEntry> entries;
        entries.reserve(cards.size());
        for (const auto& c : cards) {
            entries.push_back(DeckCardEntry{c.grp_id, c.qty, c.qty, std::nullopt});
        }
        return entries;
    };

    state_.deck_list = to_entries(e.deck_cards);
    state_.sideboard_list = to_entries(e.sideboard_cards);
    state_.commander_grp_ids = e.commander_grp_ids;

    state_.library_size = 0;
    for (const auto& c : e.deck_cards) state_.library_size += c.qty;

    state_.is_sideboarding = false;
}

void GameStateEngine::on_game_state(const GameStateUpdateEvent& e) {
    for (const auto& z : e.zones) {
        zones_[z.zone_id] = z;
    }

    for (const auto& go : e.game_objects) {
        object_grp_ids_[go.instance_id] = go.grp_id;
        object_owners_[go.instance_id] = go.owner_seat_id;
        object_zones_[go.instance_id] = go.zone_id;
        if (go.name && go.grp_id != 0 && !is_numeric_name(*go.name)) {
            object_names_[go.grp_id] = *go.name;
        }
    }

    rebuild_zones();

    // Mulligan prompts can arrive before the hand is visible
    if (state_.opening_hand.empty() && state_.turn_number <= 1 && !state_.hand.empty()) {
        state_.opening_hand = state_.hand;
    }

    // Life totals come only from life_total_change; the players array can be stale
    if (e.turn_info) {
        const auto& t = *e.turn_info;
        if (t.turn_number > 0) {
            state_.turn_number = t.turn_number;
            state_.is_sideboarding = false;
        }
        state_.active_player = t.active_player;
        if (!t.phase.empty()) state_.phase = t.phase;
        if (!t.step.empty()) state_.step = t.step;
    }
}

void GameStateEngine::on_mulligan(const MulliganPromptEvent& e) {
    if (e.seat_id != state_.player_seat_id) return;
    state_.mulligan_count = e.mulligan_count;
    if (!e.hand_grp_ids.empty()) {
        state_.opening_hand = e.hand_grp_ids;
    }
}

void GameStateEngine::on_card_drawn(const CardDrawnEvent& e) {
    if (e.owner_seat_id != state_.player_seat_id) return;
    state_.cards_drawn.push_back(e.grp_id);
    decrement_deck_card(e.grp_id);
}

void GameStateEngine::on_card_played(const CardPlayedEvent& e) {
    if (e.owner_seat_id == state_.player_seat_id) return;
    auto& seen = state_.opponent_cards_seen;
    if (std::find(seen.begin(), seen.end(), e.grp_id) == seen.end()) {
        seen.push_back(e.grp_id);
    }
}

void GameStateEngine::on_zone_change(const ZoneChangeEvent& e) {
    object_zones_[e.instance_id] = e.to_zone_id;

    // Milled, exiled or put onto the battlefield straight from library
    if (e.owner_seat_id == state_.player_seat_id &&
        e.from_zone_type == zone_type::kLibrary &&
        e.to_zone_type != zone_type::kHand) {
        decrement_deck_card(e.grp_id);
    }
}

void GameStateEngine::on_life_change(const LifeTotalChangeEvent& e) {
    if (e.seat_id == state_.player_seat_id) {
        state_.player_life = e.life_total;
    } else {
        state_.opponent_life = e.life_total;
    }
}

void GameStateEngine::on_turn_change(const TurnChangeEvent& e) {
    state_.turn_number = e.turn_number;
    state_.active_player = e.active_player;
    state_.is_sideboarding = false;
}

void GameStateEngine::on_phase_change(const PhaseChangeEvent& e) {
    state_.phase = e.phase;
    state_.step = e.step;
    state_.turn_number = e.turn_number;
}

void GameStateEngine::on_intermission(const IntermissionEvent& e) {
    state_.is_sideboarding = true;
    state_.game_number = std::max(e.game_number, state_.game_number + 1);

    state_.hand.clear();
    state_.battlefield.clear();
    state_.graveyard.clear();
    state_.exile.clear();
    state_.opponent_battlefield.clear();
    state_.opponent_graveyard.clear();
    state_.cards_drawn.clear();
    state_.turn_number = 0;
    state_.phase.clear();
    state_.step.clear();
    state_.mulligan_count = 0;
    state_.opening_hand.clear();

    zones_.clear();
    object_zones_.clear();
    object_grp_ids_.clear();
    object_owners_.clear();

    state_.library_size = 0;
    for (auto& entry : state_.deck_list) {
        entry.remaining = entry.qty;
        state_.library_size += entry.qty;
    }

    int life = starting_life(state_.format);
    state_.player_life = life;
    state_.opponent_life = life;
}

void GameStateEngine::on_match_complete(const MatchCompleteEvent&) {
    state_.is_active = false;
    state_.is_sideboarding = false;
}

// ── Helpers ─────────────────────────────────────────────────────────────────

void GameStateEngine::clear_tracking() {
    zones_.clear();
    object_zones_.clear();
    object_grp_ids_.clear();
    object_owners_.clear();
    object_names_.clear();
}

void GameStateEngine::decrement_deck_card(int grp_id) {
    for (auto& entry : state_.deck_list) {
        if (entry.grp_id == grp_id && entry.remaining > 0) {
            entry.remaining--;
            break;
        }
    }
    // Tokens and unknown cards still leave the library
    state_.library_size = std::max(0, state_.library_size - 1);
}

void GameStateEngine::rebuild_zones() {
    std::vector<int> hand, battlefield, graveyard, exile, opp_battlefield, opp_graveyard;

    for (const auto& [instance_id, zone_id] : object_zones_) {
        auto zone = zones_.find(zone_id);
        auto grp = object_grp_ids_.find(instance_id);
        if (zone == zones_.end() || grp == object_grp_ids_.end() || grp->second == 0) continue;

        auto owner = object_owners_.find(instance_id);
        bool mine = owner != object_owners_.end() && owner->second == state_.player_seat_id;
        const std::string& type = zone->second.type;
        int grp_id = grp->second;

        if (type == zone_type::kHand) {
            if (mine) hand.push_back(grp_id);
        } else if (type == zone_type::kBattlefield) {
            (mine ? battlefield : opp_battlefield).push_back(grp_id);
        } else if (type == zone_type::kGraveyard) {
            (mine ? graveyard : opp_graveyard).push_back(grp_id);
        } else if (type == zone_type::kExile) {
            if (mine) exile.push_back(grp_id);
        }
    }

    state_.hand = std::move(hand);
    state_.battlefield = std::move(battlefield);
    state_.graveyard = std::move(graveyard);
    state_.exile = std::move(exile);
    state_.opponent_battlefield = std::move(opp_battlefield);
    state_.opponent_graveyard = std::move(opp_graveyard);

    // Catch-up and late join only ever see opponent cards through zones
    auto& seen = state_.opponent_cards_seen;
    for (const auto* list : {&state_.opponent_battlefield, &state_.opponent_graveyard}) {
        for (int grp_id : *list) {
            if (std::find(seen.begin(), seen.end(), grp_id) == seen.end()) {
                seen.push_back(grp_id);
            }
        }
    }
}

void GameStateEngine::update_draw_probabilities() {
    state_.draw_probabilities.clear();
    if (state_.library_size <= 0) return;

    for (const auto& entry : state_.deck_list) {
        if (entry.remaining > 0) {
            state_.draw_probabilities[entry.grp_id] =
                static_cast<double>(entry.remaining) / state_.library_size;
        }
    }
}

void GameStateEngine::notify() {
    if (listeners_.empty()) return;

    const GameStateSnapshot copy = state_;
    // Listeners may unsubscribe while being notified
    auto listeners = listeners_;
    for (const auto& [id, listener] : listeners) {
        try {
            listener(copy);
        } catch (const std::exception& e) {
            TrackerLog::warn("Engine", "State listener " + std::to_string(id) + " threw: " + e.what());
        }
    }
}

} // namespace arena_tracker
