#include "telemetry_recorder.hpp"
#include "tracker_log.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace arena_tracker {

namespace {

std::string iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return out.str();
}

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

nlohmann::json TelemetryAction::to_json() const {
    return {
        {"match_id", match_id},
        {"game_number", game_number},
        {"turn_number", turn_number},
        {"phase", phase},
        {"action_type", action_type},
        {"player", player},
        {"grp_id", optional_json(grp_id)},
        {"card_name", optional_json(card_name)},
        {"details", optional_json(details)},
        {"action_order", action_order}
    };
}

nlohmann::json MatchTelemetrySummary::to_json() const {
    nlohmann::json life = nlohmann::json::array();
    for (const auto& point : life_progression) {
        life.push_back({{"turn", point.turn}, {"player", point.player}, {"opponent", point.opponent}});
    }

    nlohmann::json sideboard = nlohmann::json::array();
    for (const auto& change : sideboard_changes) {
        sideboard.push_back({{"game", change.game}, {"in", change.boarded_in}, {"out", change.boarded_out}});
    }

    nlohmann::json by_turn = nlohmann::json::object();
    for (const auto& [turn, cards] : opponent_cards_by_turn) {
        by_turn[std::to_string(turn)] = cards;
    }

    return {
        {"match_id", match_id},
        {"opening_hand", opening_hand},
        {"mulligan_count", mulligan_count},
        {"on_play", optional_json(on_play)},
        {"match_start_time", match_start_time},
        {"match_end_time", match_end_time},
        {"game_count", game_count},
        {"life_progression", life},
        {"draw_order", draw_order},
        {"sideboard_changes", sideboard},
        {"opponent_cards_by_turn", by_turn}
    };
}

nlohmann::json TelemetryFlush::to_json() const {
    nlohmann::json j;
    j["actions"] = nlohmann::json::array();
    for (const auto& action : actions) {
        j["actions"].push_back(action.to_json());
    }
    if (summary) j["summary"] = summary->to_json();
    return j;
}

SideboardChange compute_sideboard_diff(const std::vector<DeckCard>& before,
                                       const std::vector<DeckCard>& after, int game) {
    std::map<int, int> delta;
    for (const auto& card : before) delta[card.grp_id] -= card.qty;
    for (const auto& card : after) delta[card.grp_id] += card.qty;

    SideboardChange change;
    change.game = game;
    for (const auto& [grp_id, diff] : delta) {
        for (int i = 0; i < diff; ++i) change.boarded_in.push_back(grp_id);
        for (int i = 0; i < -diff; ++i) change.boarded_out.push_back(grp_id);
    }
    return change;
}

// ── Recorder ────────────────────────────────────────────────────────────────

void MatchTelemetryRecorder::start_match(const std::string& match_id,
                                         const std::optional<std::string>& format,
                                         const std::optional<std::string>& player_name,
                                         const std::optional<std::string>& opponent_name) {
    match_id_ = match_id;
    start_time_ = iso_timestamp();
    game_number_ = 1;

    add_action("match_start", 0, "", "self", std::nullopt, std::nullopt, {
        {"format", optional_json(format)},
        {"playerName", optional_json(player_name)},
        {"opponentName", optional_json(opponent_name)}
    });
}

void MatchTelemetryRecorder::on_deck_submission(const std::vector<DeckCard>& deck_cards,
                                                const std::vector<DeckCard>& sideboard_cards) {
    if (awaiting_sideboard_deck_ && !pre_sideboard_deck_.empty()) {
        sideboard_changes_.push_back(compute_sideboard_diff(pre_sideboard_deck_, deck_cards, game_number_));
    }
    awaiting_sideboard_deck_ = false;
    pre_sideboard_deck_ = deck_cards;

    add_action("deck_submitted", current_turn_, current_phase_, "self", std::nullopt, std::nullopt, {
        {"mainCount", deck_cards.size()},
        {"sideboardCount", sideboard_cards.size()}
    });
}

void MatchTelemetryRecorder::on_mulligan(int mulligan_count, const std::vector<int>& hand_grp_ids) {
    mulligan_count_ = mulligan_count;

    if (mulligan_count == 0) {
        opening_hand_ = hand_grp_ids;
        add_action("mulligan_keep", 0, "", "self", std::nullopt, std::nullopt, {
            {"handSize", hand_grp_ids.size()},
            {"hand", hand_grp_ids}
        });
    } else {
        add_action("mulligan_mull", 0, "", "self", std::nullopt, std::nullopt, {
            {"mulliganCount", mulligan_count},
            {"handSize", hand_grp_ids.size()}
        });
    }
}

void MatchTelemetryRecorder::on_card_drawn(int grp_id, int turn_number,
                                           const std::optional<std::string>& card_name) {
    draw_order_.push_back(grp_id);
    add_action("card_drawn", turn_number, current_phase_, "self", grp_id, card_name);
}

void MatchTelemetryRecorder::on_card_played(int grp_id, int owner_seat_id, int player_seat_id,
                                            int turn_number,
                                            const std::optional<std::string>& card_name) {
    bool mine = owner_seat_id == player_seat_id;
    add_action("card_played", turn_number, current_phase_, mine ? "self" : "opponent", grp_id, card_name);
    if (!mine) {
        opponent_cards_by_turn_[turn_number].push_back(grp_id);
    }
}

void MatchTelemetryRecorder::on_life_change(int seat_id, int player_seat_id, int life_total,
                                            int turn_number) {
    bool mine = seat_id == player_seat_id;
    if (mine) {
        last_player_life_ = life_total;
    } else {
        last_opponent_life_ = life_total;
    }
    life_progression_.push_back(LifePoint{turn_number, last_player_life_, last_opponent_life_});

    add_action("life_change", turn_number, current_phase_, mine ? "self" : "opponent",
               std::nullopt, std::nullopt, {{"lifeTotal", life_total}, {"seatId", seat_id}});
}

void MatchTelemetryRecorder::on_turn_change(int turn_number, int active_player, int player_seat_id) {
    current_turn_ = turn_number;
    bool mine = active_player == player_seat_id;

    if (turn_number == 1 && !on_play_) {
        on_play_ = mine;
    }
    add_action("turn_start", turn_number, "", mine ? "self" : "opponent");
}

void MatchTelemetryRecorder::on_phase_change(const std::string& phase, const std::string& step,
                                             int turn_number) {
    current_phase_ = phase;
    add_action("phase_change", turn_number, phase, "self", std::nullopt, std::nullopt,
               {{"step", step}});
}

void MatchTelemetryRecorder::on_intermission(int game_number) {
    add_action("sideboard_start", current_turn_, "", "self", std::nullopt, std::nullopt,
               {{"gameNumber", game_number}});

    game_number_ = game_number;
    awaiting_sideboard_deck_ = true;

    last_player_life_ = 20;
    last_opponent_life_ = 20;
    current_turn_ = 0;
    last_flush_turn_ = 0;
}

void MatchTelemetryRecorder::end_match(MatchResult result) {
    end_time_ = iso_timestamp();
    add_action("match_end", current_turn_, current_phase_, "self", std::nullopt, std::nullopt,
               {{"result", match_result_name(result)}});
}

bool MatchTelemetryRecorder::should_flush() const {
    return current_turn_ - last_flush_turn_ >= kFlushIntervalTurns && !pending_.empty();
}

TelemetryFlush MatchTelemetryRecorder::flush() {
    TelemetryFlush batch;
    batch.actions = std::move(pending_);
    pending_.clear();
    flushed_count_ += batch.actions.size();
    last_flush_turn_ = current_turn_;
    return batch;
}

TelemetryFlush MatchTelemetryRecorder::flush_final() {
    TelemetryFlush batch = flush();

    MatchTelemetrySummary summary;
    summary.match_id = match_id_;
    summary.opening_hand = opening_hand_;
    summary.mulligan_count = mulligan_count_;
    summary.on_play = on_play_;
    summary.match_start_time = start_time_;
    summary.match_end_time = end_time_.empty() ? iso_timestamp() : end_time_;
    summary.game_count = game_number_;
    summary.life_progression = life_progression_;
    summary.draw_order = draw_order_;
    summary.sideboard_changes = sideboard_changes_;
    summary.opponent_cards_by_turn = opponent_cards_by_turn_;
    batch.summary = std::move(summary);

    TrackerLog::debug("Telemetry", "Final flush for " + match_id_ + ": " +
                      std::to_string(batch.actions.size()) + " actions");
    return batch;
}

void MatchTelemetryRecorder::add_action(const std::string& type, int turn, const std::string& phase,
                                        const std::string& player, std::optional<int> grp_id,
                                        std::optional<std::string> card_name,
                                        const nlohmann::json& details) {
    TelemetryAction action;
    action.match_id = match_id_;
    action.game_number = game_number_;
    action.turn_number = turn;
    action.phase = phase;
    action.action_type = type;
    action.player = player;
    action.grp_id = grp_id;
    action.card_name = std::move(card_name);
    if (!details.is_null()) action.details = details.dump();
    action.action_order = action_counter_++;
    pending_.push_back(std::move(action));
}

} // namespace arena_tracker
