#include <catch2/catch_test_macros.hpp>
#include "match_history.hpp"
#include "block_extractor.hpp"
#include <string>

using namespace arena_tracker;

namespace {

const char* SAMPLE_LOG =
    "[UnityCrossThreadLogger]==> Event.DeckSubmitV3(12345): {\"CourseDeck\":{\"mainDeck\":[{\"cardId\":67890,\"quantity\":4},{\"cardId\":67891,\"quantity\":3}]}}\n"
    "[UnityCrossThreadLogger]{\"matchId\":\"match-001-test\",\"gameStateMessage\":{\"turnInfo\":{\"turnNumber\":1}}}\n"
    "[UnityCrossThreadLogger]==> MatchComplete(12346): {\"matchComplete\":{\"result\":\"ResultType_Win\"}}\n"
    "[UnityCrossThreadLogger]{\"matchId\":\"match-002-test\",\"gameStateMessage\":{\"turnInfo\":{\"turnNumber\":5}}}\n"
    "[UnityCrossThreadLogger]==> MatchComplete(12347): {\"matchComplete\":{\"result\":\"ResultType_Loss\"}}\n";

} // namespace

TEST_CASE("parse_arena_log reconstructs completed matches", "[history]") {
    auto result = parse_arena_log(SAMPLE_LOG);

    REQUIRE(result.matches.size() == 2);

    const auto& first = result.matches[0];
    REQUIRE(first.match_id == "match-001-test");
    REQUIRE(first.result == MatchResult::Win);
    REQUIRE(first.turns == 1);
    REQUIRE(first.deck_cards.has_value());
    REQUIRE(first.deck_cards->size() == 2);
    REQUIRE((*first.deck_cards)[0].id == "67890");
    REQUIRE((*first.deck_cards)[0].qty == 4);

    const auto& second = result.matches[1];
    REQUIRE(second.match_id == "match-002-test");
    REQUIRE(second.result == MatchResult::Loss);
    REQUIRE(second.turns == 5);

    REQUIRE_FALSE(result.collection.has_value());
}

TEST_CASE("Matches without a result are dropped", "[history]") {
    auto result = parse_arena_log(
        "[UnityCrossThreadLogger]{\"matchId\":\"abandoned\",\"gameStateMessage\":{\"turnInfo\":{\"turnNumber\":2}}}\n");
    REQUIRE(result.matches.empty());
}

TEST_CASE("Game objects split into own and opponent cards", "[history]") {
    auto result = parse_arena_log(
        "[UnityCrossThreadLogger]{\"screenName\":\"Me\"}\n"
        "[UnityCrossThreadLogger]{\"matchId\":\"m-3\",\"gameStateMessage\":{\"gameObjects\":["
        "{\"grpId\":100,\"ownerSeatId\":1},{\"grpId\":100,\"ownerSeatId\":1},{\"grpId\":200,\"ownerSeatId\":2}]}}\n"
        "[UnityCrossThreadLogger]==> MatchComplete(1): {\"matchComplete\":{\"result\":\"ResultType_Draw\"}}\n");

    REQUIRE(result.matches.size() == 1);
    const auto& match = result.matches[0];
    REQUIRE(match.player_name == std::optional<std::string>("Me"));
    REQUIRE(match.result == MatchResult::Draw);
    REQUIRE(match.cards_played == std::vector<std::string>{"100"});
    REQUIRE(match.opponent_cards_seen == std::vector<std::string>{"200"});
    REQUIRE(match.to_json()["result"] == "draw");
}

TEST_CASE("Collection uses the last inventory payload", "[history]") {
    auto result = parse_arena_log(
        "[UnityCrossThreadLogger]<== PlayerInventory.GetPlayerCardsV3(12348): {\"67890\": 4, \"67891\": 2, \"12345\": 1}\n"
        "[UnityCrossThreadLogger]<== PlayerInventory.GetPlayerCardsV3(12349): {\"67890\": 4, \"99999\": 3, \"note\": 1}\n"
        "[UnityCrossThreadLogger]<== PlayerInventory.GetPlayerCardsV3(12350): {\"note\": \"empty\"}\n");

    REQUIRE(result.collection.has_value());
    const auto& collection = *result.collection;
    REQUIRE(collection.size() == 2);
    REQUIRE(collection.at("67890") == 4);
    REQUIRE(collection.at("99999") == 3);
    REQUIRE(collection.count("note") == 0);
}

TEST_CASE("MatchHistoryParser carries a match across feeds", "[history]") {
    MatchHistoryParser parser;

    REQUIRE(parser.feed(extract_json_blocks(
        "[UnityCrossThreadLogger]==> Event.DeckSubmitV3(1): {\"CourseDeck\":{\"mainDeck\":[{\"cardId\":67890,\"quantity\":4}]}}\n"
        "[UnityCrossThreadLogger]{\"matchId\":\"long-match\",\"gameStateMessage\":{\"turnInfo\":{\"turnNumber\":1}}}\n"))
        .empty());
    REQUIRE(parser.in_match());

    for (int turn = 2; turn <= 9; ++turn) {
        std::string line = "[UnityCrossThreadLogger]{\"greToClientEvent\":{\"greToClientMessages\":[{\"gameStateMessage\":"
                           "{\"turnInfo\":{\"turnNumber\":" + std::to_string(turn) + "},"
                           "\"gameObjects\":[{\"grpId\":" + std::to_string(500 + turn % 2) + ",\"ownerSeatId\":" +
                           std::to_string(turn % 2 + 1) + "}]}}]}}\n";
        REQUIRE(parser.feed(extract_json_blocks(line)).empty());
    }

    auto completed = parser.feed(extract_json_blocks(
        "[UnityCrossThreadLogger]==> MatchComplete(2): {\"matchComplete\":{\"result\":\"ResultType_Win\"}}\n"));
    REQUIRE(completed.size() == 1);
    REQUIRE_FALSE(parser.in_match());

    const auto& match = completed[0];
    REQUIRE(match.match_id == "long-match");
    REQUIRE(match.result == MatchResult::Win);
    REQUIRE(match.turns == 9);
    REQUIRE(match.cards_played == std::vector<std::string>{"500"});
    REQUIRE(match.opponent_cards_seen == std::vector<std::string>{"501"});
    REQUIRE(match.deck_cards->at(0).id == "67890");

    parser.reset();
    REQUIRE(parser.feed(extract_json_blocks(
        "[UnityCrossThreadLogger]==> MatchComplete(3): {\"matchComplete\":{\"result\":\"ResultType_Loss\"}}\n"))
        .empty());
}
