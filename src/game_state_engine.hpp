#pragma once

#include "game_events.hpp"
#include "game_state.hpp"
#include <functional>
#include <map>
#include <unordered_map>
#include <vector>

namespace arena_tracker {

// Consumes ArenaGameEvents and maintains a live GameStateSnapshot.
//
// Lifecycle: idle -> active (match_start) -> sideboarding (intermission)
// -> active (next deck submission or turn) -> inactive (match_complete).
// Not thread-safe; driven from the watcher's poll thread.
class GameStateEngine {
public:
    using Listener = std::function<void(const GameStateSnapshot&)>;
    using ListenerId = int;

    GameStateEngine() = default;

    GameStateEngine(const GameStateEngine&) = delete;
    GameStateEngine& operator=(const GameStateEngine&) = delete;

    void process_event(const ArenaGameEvent& event);
    void process_events(const std::vector<ArenaGameEvent>& events);

    GameStateSnapshot snapshot() const { return state_; }
    const GameStateSnapshot& state() const { return state_; }

    // Listeners are called synchronously after every processed event
    ListenerId subscribe(Listener listener);
    void unsubscribe(ListenerId id);

    void reset();

    // Attach resolved metadata to deck/sideboard entries that have none yet
    void resolve_card(int grp_id, const ResolvedCard& card);

    // grpId -> card name, learned from game objects with non-numeric names
    const std::unordered_map<int, std::string>& object_names() const { return object_names_; }

private:
    void on_match_start(const MatchStartEvent& e);
    void on_deck_submission(const DeckSubmissionEvent& e);
    void on_game_state(const GameStateUpdateEvent& e);
    void on_mulligan(const MulliganPromptEvent& e);
    void on_card_drawn(const CardDrawnEvent& e);
    void on_card_played(const CardPlayedEvent& e);
    void on_zone_change(const ZoneChangeEvent& e);
    void on_life_change(const LifeTotalChangeEvent& e);
    void on_turn_change(const TurnChangeEvent& e);
    void on_phase_change(const PhaseChangeEvent& e);
    void on_intermission(const IntermissionEvent& e);
    void on_match_complete(const MatchCompleteEvent& e);

    void clear_tracking();
    void decrement_deck_card(int grp_id);
    void rebuild_zones();
    void update_draw_probabilities();
    void notify();

    GameStateSnapshot state_;

    std::unordered_map<int, ZoneInfo> zones_;
    std::map<int, int> object_zones_;      // instanceId -> zoneId, ordered for stable zone lists
    std::unordered_map<int, int> object_grp_ids_;
    std::unordered_map<int, int> object_owners_;
    std::unordered_map<int, std::string> object_names_;

    std::vector<std::pair<ListenerId, Listener>> listeners_;
    ListenerId next_listener_id_ = 1;
};

} // namespace arena_tracker
