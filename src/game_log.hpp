#pragma once

#include "game_events.hpp"
#include "game_state.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace arena_tracker {

enum class GameLogType { System, Turn, Phase, Action, Life, Damage, Result };

const char* game_log_type_name(GameLogType type);

enum class LogSide { Self, Opponent };

// One line of the match narrative ("Me drew Opt", "Turn 3: Opp")
struct GameLogEntry {
    GameLogType type = GameLogType::System;
    std::string text;
    std::optional<LogSide> player;

    std::optional<int> turn_number;   // shared turn, see shared_turn()
    std::optional<std::string> card_name;
    std::optional<int> card_grp_id;
    std::optional<std::string> target_card_name;
    std::optional<int> target_grp_id;
    std::optional<int> amount;
    std::optional<int> life_before;
    std::optional<int> life_after;
    std::optional<std::string> phase;
    std::optional<std::string> verb;

    // Consecutive identical entries collapse into one with a count
    int repeat = 1;

    std::string display_text() const;
    nlohmann::json to_json() const;
};

struct LastMatchInfo {
    std::string match_id;
    std::optional<std::string> format;
    std::optional<std::string> player_name;
    std::optional<std::string> opponent_name;
    std::optional<MatchResult> result;

    nlohmann::json to_json() const;
};

// Both players' turns share one number: raw turns 1 and 2 are turn 1
int shared_turn(int raw_turn);

// Display label for a phase/step, or nullopt for steps not worth a line
std::optional<std::string> phase_label(const std::string& phase, const std::string& step);

// Turns game events into a readable match log. Phase lines are held back
// until an action, life or damage line follows them, so empty phases never
// show up. The history outlives the match it describes.
class GameLog {
public:
    using CardNamer = std::function<std::optional<std::string>(int grp_id)>;
    // `collapsed` is true when an existing entry gained another repeat
    using Listener = std::function<void(const GameLogEntry& entry, bool collapsed)>;

    void set_listener(Listener listener) { listener_ = std::move(listener); }

    // Starts a new narrative; the previous match's history is discarded
    void begin_match(const MatchStartEvent& event);

    // Narrates one event. `before` is the engine state prior to processing
    // it, `after` the state once processed.
    void record(const ArenaGameEvent& event, const GameStateSnapshot& before,
                const GameStateSnapshot& after, const CardNamer& card_name);

    void add(GameLogEntry entry);

    const std::vector<GameLogEntry>& history() const { return history_; }
    const std::optional<GameLogEntry>& pending_phase() const { return pending_phase_; }
    const std::optional<LastMatchInfo>& last_match() const { return last_match_; }

private:
    void flush_pending_phase();
    void emit(const GameLogEntry& entry, bool collapsed);

    std::vector<GameLogEntry> history_;
    std::optional<GameLogEntry> pending_phase_;
    std::optional<LastMatchInfo> last_match_;
    int last_logged_turn_ = 0;
    std::string last_logged_phase_;
    Listener listener_;
};

} // namespace arena_tracker
