#include <catch2/catch_test_macros.hpp>
#include "game_log.hpp"
#include <map>
#include <string>
#include <vector>

using namespace arena_tracker;

namespace {

GameLogEntry entry(GameLogType type, const std::string& text) {
    GameLogEntry e;
    e.type = type;
    e.text = text;
    return e;
}

GameStateSnapshot table(int turn) {
    GameStateSnapshot s;
    s.player_seat_id = 1;
    s.player_name = std::string("Me");
    s.opponent_name = std::string("Opp");
    s.turn_number = turn;
    s.is_active = true;
    return s;
}

std::vector<std::string> texts(const GameLog& log) {
    std::vector<std::string> out;
    for (const auto& e : log.history()) out.push_back(e.display_text());
    return out;
}

GameLog::CardNamer names() {
    static const std::map<int, std::string> known = {{111, "Llanowar Elves"}, {222, "Opt"}, {333, "Shock"}};
    return [](int grp_id) -> std::optional<std::string> {
        auto it = known.find(grp_id);
        if (it == known.end()) return std::nullopt;
        return it->second;
    };
}

MatchStartEvent match_start() {
    MatchStartEvent e;
    e.match_id = "m-log";
    e.format = std::string("Ladder");
    e.player_name = std::string("Me");
    e.opponent_name = std::string("Opp");
    return e;
}

} // namespace

TEST_CASE("shared_turn and phase_label", "[gamelog]") {
    REQUIRE(shared_turn(1) == 1);
    REQUIRE(shared_turn(2) == 1);
    REQUIRE(shared_turn(3) == 2);
    REQUIRE(shared_turn(0) == 0);

    REQUIRE(phase_label("Phase_Main1", "") == std::optional<std::string>("Precombat Main"));
    REQUIRE(phase_label("Phase_Combat", "Step_DeclareAttack") == std::optional<std::string>("Declare Attackers"));
    REQUIRE_FALSE(phase_label("Phase_Beginning", "Step_Upkeep").has_value());
    REQUIRE_FALSE(phase_label("Phase_Combat", "Step_BeginCombat").has_value());
    REQUIRE_FALSE(phase_label("Phase_Ending", "Step_Cleanup").has_value());
}

TEST_CASE("GameLog holds phase lines until something happens", "[gamelog]") {
    GameLog log;

    SECTION("Phase followed by an action is kept, in order") {
        log.add(entry(GameLogType::Phase, "Precombat Main"));
        REQUIRE(log.history().empty());
        REQUIRE(log.pending_phase().has_value());

        log.add(entry(GameLogType::Action, "Me played Forest"));
        REQUIRE(texts(log) == std::vector<std::string>{"Precombat Main", "Me played Forest"});
        REQUIRE_FALSE(log.pending_phase().has_value());
    }

    SECTION("Phase with nothing in it is dropped at the next turn") {
        log.add(entry(GameLogType::Phase, "Declare Attackers"));
        log.add(entry(GameLogType::Turn, "Turn 2: Opp"));
        REQUIRE(texts(log) == std::vector<std::string>{"Turn 2: Opp"});
    }

    SECTION("A later phase replaces an empty one") {
        log.add(entry(GameLogType::Phase, "Precombat Main"));
        log.add(entry(GameLogType::Phase, "End Step"));
        log.add(entry(GameLogType::Life, "Opp took 2 damage (20 -> 18)"));
        REQUIRE(texts(log) == std::vector<std::string>{"End Step", "Opp took 2 damage (20 -> 18)"});
    }

    SECTION("System lines leave the pending phase alone") {
        log.add(entry(GameLogType::Phase, "Precombat Main"));
        log.add(entry(GameLogType::System, "Opening hand"));
        REQUIRE(texts(log) == std::vector<std::string>{"Opening hand"});
        REQUIRE(log.pending_phase().has_value());
    }
}

TEST_CASE("GameLog collapses repeated lines", "[gamelog]") {
    GameLog log;
    std::vector<std::pair<std::string, bool>> seen;
    log.set_listener([&seen](const GameLogEntry& e, bool collapsed) {
        seen.emplace_back(e.display_text(), collapsed);
    });

    auto sacrifice = entry(GameLogType::Action, "Me sacrificed Snow-Covered Forest");
    sacrifice.player = LogSide::Self;
    log.add(sacrifice);
    log.add(sacrifice);
    log.add(sacrifice);

    REQUIRE(log.history().size() == 1);
    REQUIRE(log.history()[0].repeat == 3);
    REQUIRE(log.history()[0].display_text() == "Me sacrificed Snow-Covered Forest (x3)");
    REQUIRE(log.history()[0].to_json()["text"] == "Me sacrificed Snow-Covered Forest (x3)");
    REQUIRE(seen.size() == 3);
    REQUIRE_FALSE(seen[0].second);
    REQUIRE(seen[2] == std::make_pair(std::string("Me sacrificed Snow-Covered Forest (x3)"), true));

    SECTION("Same text from the other player is a new line") {
        sacrifice.player = LogSide::Opponent;
        log.add(sacrifice);
        REQUIRE(log.history().size() == 2);
    }
}

TEST_CASE("GameLog narrates game events", "[gamelog]") {
    GameLog log;
    log.begin_match(match_start());
    REQUIRE(texts(log) == std::vector<std::string>{"Ladder: Me vs Opp"});
    REQUIRE(log.last_match()->match_id == "m-log");
    REQUIRE_FALSE(log.last_match()->result.has_value());

    auto state = table(3);

    SECTION("Draws hide the opponent's card") {
        log.record(CardDrawnEvent{10, 222, 1}, state, state, names());
        log.record(CardDrawnEvent{11, 333, 2}, state, state, names());

        const auto& history = log.history();
        REQUIRE(history[1].text == "Me drew Opt");
        REQUIRE(history[1].card_name == std::optional<std::string>("Opt"));
        REQUIRE(history[1].turn_number == 2);
        REQUIRE(history[2].text == "Opp drew a card");
        REQUIRE_FALSE(history[2].card_name.has_value());
        REQUIRE(history[2].player == LogSide::Opponent);
    }

    SECTION("Plays and casts") {
        log.record(CardPlayedEvent{10, 111, 1, zone_type::kHand, zone_type::kBattlefield}, state, state, names());
        log.record(CardPlayedEvent{11, 333, 2, zone_type::kHand, zone_type::kStack}, state, state, names());
        log.record(CardPlayedEvent{12, 999, 2, zone_type::kStack, zone_type::kBattlefield}, state, state, names());

        REQUIRE(texts(log) == std::vector<std::string>{
            "Ladder: Me vs Opp", "Me played Llanowar Elves", "Opp cast Shock", "Opp cast Card #999"});
    }

    SECTION("Life changes read against the previous total") {
        auto before = state;
        auto after = state;
        after.opponent_life = 17;
        log.record(LifeTotalChangeEvent{2, 17}, before, after, names());

        before = after;
        after.player_life = 23;
        log.record(LifeTotalChangeEvent{1, 23}, before, after, names());

        const auto& history = log.history();
        REQUIRE(history[1].text == "Opp took 3 damage (20 -> 17)");
        REQUIRE(history[1].amount == 3);
        REQUIRE(history[1].life_before == 20);
        REQUIRE(history[1].life_after == 17);
        REQUIRE(history[2].text == "Me gained 3 life (20 -> 23)");
        REQUIRE(history[2].player == LogSide::Self);
    }

    SECTION("Damage is credited to the side that dealt it") {
        DamageDealtEvent to_seat;
        to_seat.source_grp_id = 333;
        to_seat.amount = 2;
        to_seat.target_seat_id = 2;
        log.record(to_seat, state, state, names());

        DamageDealtEvent to_creature;
        to_creature.source_grp_id = 333;
        to_creature.amount = 2;
        to_creature.target_grp_id = 111;
        log.record(to_creature, state, state, names());

        const auto& history = log.history();
        REQUIRE(history[1].text == "Shock dealt 2 damage to Opp");
        REQUIRE(history[1].player == LogSide::Self);
        REQUIRE(history[2].text == "Shock dealt 2 damage to Llanowar Elves");
        REQUIRE(history[2].target_grp_id == 111);
        REQUIRE_FALSE(history[2].player.has_value());
    }

    SECTION("Zone changes only narrate removal categories") {
        ZoneChangeEvent destroy;
        destroy.grp_id = 111;
        destroy.owner_seat_id = 1;
        destroy.category = std::string("Destroy");
        log.record(destroy, state, state, names());

        ZoneChangeEvent sacrifice = destroy;
        sacrifice.grp_id = 222;
        sacrifice.owner_seat_id = 2;
        sacrifice.category = std::string("Sacrifice");
        log.record(sacrifice, state, state, names());

        ZoneChangeEvent draw = destroy;
        draw.category = std::string("Draw");
        log.record(draw, state, state, names());

        REQUIRE(texts(log) == std::vector<std::string>{
            "Ladder: Me vs Opp", "Llanowar Elves was destroyed", "Opp sacrificed Opt"});
    }

    SECTION("Turns and phases") {
        log.record(TurnChangeEvent{3, 1}, state, state, names());
        log.record(TurnChangeEvent{3, 1}, state, state, names());
        log.record(PhaseChangeEvent{"Phase_Beginning", "Step_Upkeep", 3}, state, state, names());
        log.record(PhaseChangeEvent{"Phase_Main1", "", 3}, state, state, names());
        log.record(PhaseChangeEvent{"Phase_Main1", "", 3}, state, state, names());
        log.record(CardPlayedEvent{10, 111, 1, zone_type::kHand, zone_type::kBattlefield}, state, state, names());

        auto next = table(4);
        log.record(TurnChangeEvent{4, 2}, next, next, names());

        REQUIRE(texts(log) == std::vector<std::string>{
            "Ladder: Me vs Opp", "Turn 2: Me", "Precombat Main", "Me played Llanowar Elves", "Turn 2: Opp"});
        REQUIRE(log.history()[4].player == LogSide::Opponent);
    }

    SECTION("Opening hand lists card names") {
        log.record(MulliganPromptEvent{1, 1, {111, 222}}, state, state, names());
        REQUIRE(log.history().back().text == "Opening hand (mulligan 1): Llanowar Elves, Opt");
    }

    SECTION("Result is kept with the last match") {
        log.record(MatchCompleteEvent{"m-log", MatchResult::Win, 1}, state, state, names());
        REQUIRE(log.history().back().text == "Victory!");
        REQUIRE(log.last_match()->result == MatchResult::Win);
        REQUIRE(log.last_match()->to_json()["result"] == "win");

        auto next = match_start();
        next.match_id = "m-next";
        log.begin_match(next);
        REQUIRE(log.history().size() == 1);
        REQUIRE(log.last_match()->match_id == "m-next");
    }
}
