#include <catch2/catch_test_macros.hpp>
#include "telemetry_recorder.hpp"

using namespace arena_tracker;

namespace {

constexpr int A = 1001;
constexpr int B = 1002;
constexpr int C = 1003;

} // namespace

TEST_CASE("compute_sideboard_diff", "[telemetry]") {
    SECTION("Swap two copies") {
        auto change = compute_sideboard_diff({{A, 4}, {B, 2}}, {{A, 2}, {C, 2}, {B, 2}}, 2);
        REQUIRE(change.game == 2);
        REQUIRE(change.boarded_out == std::vector<int>{A, A});
        REQUIRE(change.boarded_in == std::vector<int>{C, C});
    }

    SECTION("Identical decks") {
        auto change = compute_sideboard_diff({{A, 4}}, {{A, 4}}, 3);
        REQUIRE(change.boarded_in.empty());
        REQUIRE(change.boarded_out.empty());
    }

    SECTION("Duplicate entries are summed") {
        auto change = compute_sideboard_diff({{A, 2}, {A, 2}}, {{A, 3}, {B, 1}}, 2);
        REQUIRE(change.boarded_out == std::vector<int>{A});
        REQUIRE(change.boarded_in == std::vector<int>{B});
    }
}

TEST_CASE("Recorder orders and batches actions", "[telemetry]") {
    MatchTelemetryRecorder recorder;
    recorder.start_match("m-1", std::string("Ladder"), std::string("Me"), std::string("Opp"));
    recorder.on_deck_submission({{A, 4}, {B, 2}}, {});
    recorder.on_mulligan(1, {A, A, B, B, A, A, B});
    recorder.on_mulligan(0, {A, B, A, B, A, B});
    recorder.on_turn_change(1, 1, 1);
    recorder.on_card_drawn(A, 1, std::string("Card A"));

    REQUIRE(recorder.match_id() == "m-1");
    REQUIRE_FALSE(recorder.should_flush());

    auto first = recorder.flush();
    REQUIRE(first.actions.size() == 6);
    REQUIRE(first.actions[0].action_type == "match_start");
    REQUIRE(first.actions[2].action_type == "mulligan_mull");
    REQUIRE(first.actions[3].action_type == "mulligan_keep");
    REQUIRE(first.actions[5].card_name == std::optional<std::string>("Card A"));
    for (std::size_t i = 1; i < first.actions.size(); ++i) {
        REQUIRE(first.actions[i].action_order > first.actions[i - 1].action_order);
    }

    SECTION("Flush hands out only new actions") {
        REQUIRE(recorder.flush().actions.empty());

        recorder.on_card_played(C, 2, 1, 1, std::nullopt);
        auto second = recorder.flush();
        REQUIRE(second.actions.size() == 1);
        REQUIRE(second.actions[0].player == "opponent");
        REQUIRE(second.actions[0].action_order > first.actions.back().action_order);
        REQUIRE(recorder.action_count() == 7);
    }

    SECTION("Flush becomes due every three turns") {
        recorder.on_turn_change(2, 2, 1);
        recorder.on_turn_change(3, 1, 1);
        REQUIRE_FALSE(recorder.should_flush());
        recorder.on_turn_change(4, 2, 1);
        REQUIRE(recorder.should_flush());

        recorder.flush();
        REQUIRE_FALSE(recorder.should_flush());
    }

    SECTION("Final flush carries the summary") {
        recorder.on_life_change(2, 1, 17, 1);
        recorder.on_life_change(1, 1, 18, 2);
        recorder.on_card_played(C, 2, 1, 2, std::nullopt);
        recorder.end_match(MatchResult::Win);

        auto last = recorder.flush_final();
        REQUIRE(last.actions.back().action_type == "match_end");
        REQUIRE(last.summary.has_value());

        const auto& summary = *last.summary;
        REQUIRE(summary.match_id == "m-1");
        REQUIRE(summary.opening_hand == std::vector<int>{A, B, A, B, A, B});
        REQUIRE(summary.mulligan_count == 0);
        REQUIRE(summary.on_play == std::optional<bool>(true));
        REQUIRE(summary.draw_order == std::vector<int>{A});
        REQUIRE(summary.life_progression.size() == 2);
        REQUIRE(summary.life_progression[0].opponent == 17);
        REQUIRE(summary.life_progression[1].player == 18);
        REQUIRE(summary.life_progression[1].opponent == 17);
        REQUIRE(summary.opponent_cards_by_turn.at(2) == std::vector<int>{C});
        REQUIRE_FALSE(summary.match_start_time.empty());
        REQUIRE_FALSE(summary.match_end_time.empty());

        auto j = last.to_json();
        REQUIRE(j["summary"]["on_play"] == true);
        REQUIRE(j["actions"].back()["action_type"] == "match_end");
    }
}

TEST_CASE("Recorder tracks sideboarding between games", "[telemetry]") {
    MatchTelemetryRecorder recorder;
    recorder.start_match("m-2", std::nullopt, std::nullopt, std::nullopt);
    recorder.on_deck_submission({{A, 4}, {B, 2}}, {{C, 2}});
    recorder.on_turn_change(1, 2, 1);

    recorder.on_intermission(2);
    recorder.on_deck_submission({{A, 2}, {C, 2}, {B, 2}}, {{A, 2}});

    auto batch = recorder.flush_final();
    REQUIRE(batch.summary->on_play == std::optional<bool>(false));
    REQUIRE(batch.summary->game_count == 2);
    REQUIRE(batch.summary->sideboard_changes.size() == 1);

    const auto& change = batch.summary->sideboard_changes[0];
    REQUIRE(change.game == 2);
    REQUIRE(change.boarded_out == std::vector<int>{A, A});
    REQUIRE(change.boarded_in == std::vector<int>{C, C});

    auto j = batch.summary->to_json();
    REQUIRE(j["sideboard_changes"][0]["in"] == nlohmann::json::array({C, C}));

    bool saw_sideboard_start = false;
    for (const auto& action : batch.actions) {
        if (action.action_type == "sideboard_start") {
            saw_sideboard_start = true;
            REQUIRE(action.game_number == 1);
        }
        if (action.action_type == "deck_submitted" && saw_sideboard_start) {
            REQUIRE(action.game_number == 2);
        }
    }
    REQUIRE(saw_sideboard_start);
}
