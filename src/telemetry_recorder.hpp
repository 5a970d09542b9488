#pragma once

#include "game_events.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace arena_tracker {

struct TelemetryAction {
    std::string match_id;
    int game_number = 1;
    int turn_number = 0;
    std::string phase;
    std::string action_type;
    std::string player;                    // "self" or "opponent"
    std::optional<int> grp_id;
    std::optional<std::string> card_name;
    std::optional<std::string> details;    // JSON text
    int action_order = 0;

    nlohmann::json to_json() const;
};

struct LifePoint {
    int turn = 0;
    int player = 20;
    int opponent = 20;
};

struct SideboardChange {
    int game = 0;
    std::vector<int> boarded_in;
    std::vector<int> boarded_out;
};

struct MatchTelemetrySummary {
    std::string match_id;
    std::vector<int> opening_hand;
    int mulligan_count = 0;
    std::optional<bool> on_play;
    std::string match_start_time;
    std::string match_end_time;
    int game_count = 1;
    std::vector<LifePoint> life_progression;
    std::vector<int> draw_order;
    std::vector<SideboardChange> sideboard_changes;
    std::map<int, std::vector<int>> opponent_cards_by_turn;

    nlohmann::json to_json() const;
};

// One batch handed to the telemetry transport
struct TelemetryFlush {
    std::vector<TelemetryAction> actions;
    std::optional<MatchTelemetrySummary> summary;

    bool empty() const { return actions.empty() && !summary; }
    nlohmann::json to_json() const;
};

// Multiset difference between two deck lists, by grpId quantity.
// boarded_in/boarded_out are ordered by grpId.
SideboardChange compute_sideboard_diff(const std::vector<DeckCard>& before,
                                       const std::vector<DeckCard>& after, int game);

// Records per-match player actions in order and hands them out in batches.
class MatchTelemetryRecorder {
public:
    static constexpr int kFlushIntervalTurns = 3;

    void start_match(const std::string& match_id, const std::optional<std::string>& format,
                     const std::optional<std::string>& player_name,
                     const std::optional<std::string>& opponent_name);

    void on_deck_submission(const std::vector<DeckCard>& deck_cards,
                            const std::vector<DeckCard>& sideboard_cards);
    void on_mulligan(int mulligan_count, const std::vector<int>& hand_grp_ids);
    void on_card_drawn(int grp_id, int turn_number, const std::optional<std::string>& card_name);
    void on_card_played(int grp_id, int owner_seat_id, int player_seat_id, int turn_number,
                        const std::optional<std::string>& card_name);
    void on_life_change(int seat_id, int player_seat_id, int life_total, int turn_number);
    void on_turn_change(int turn_number, int active_player, int player_seat_id);
    void on_phase_change(const std::string& phase, const std::string& step, int turn_number);
    void on_intermission(int game_number);
    void end_match(MatchResult result);

    // True once enough turns have passed since the last flush and actions are pending
    bool should_flush() const;

    TelemetryFlush flush();
    TelemetryFlush flush_final();

    size_t action_count() const { return flushed_count_ + pending_.size(); }
    const std::string& match_id() const { return match_id_; }

private:
    void add_action(const std::string& type, int turn, const std::string& phase,
                    const std::string& player, std::optional<int> grp_id = std::nullopt,
                    std::optional<std::string> card_name = std::nullopt,
                    const nlohmann::json& details = nullptr);

    std::string match_id_;
    int game_number_ = 1;
    int action_counter_ = 0;
    std::vector<TelemetryAction> pending_;
    size_t flushed_count_ = 0;

    std::vector<int> opening_hand_;
    int mulligan_count_ = 0;
    std::optional<bool> on_play_;
    std::string start_time_;
    std::string end_time_;
    std::vector<int> draw_order_;
    std::vector<LifePoint> life_progression_;
    std::vector<SideboardChange> sideboard_changes_;
    std::map<int, std::vector<int>> opponent_cards_by_turn_;

    int last_player_life_ = 20;
    int last_opponent_life_ = 20;
    int last_flush_turn_ = 0;
    int current_turn_ = 0;
    std::string current_phase_;

    std::vector<DeckCard> pre_sideboard_deck_;
    bool awaiting_sideboard_deck_ = false;
};

} // namespace arena_tracker
