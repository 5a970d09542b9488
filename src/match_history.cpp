#include "match_history.hpp"
#include "block_extractor.hpp"
#include <algorithm>
#include <cctype>

namespace arena_tracker {

using nlohmann::json;

namespace {

bool has(const json& obj, const char* key) {
    return obj.is_object() && obj.contains(key);
}

bool is_number_key(const std::string& key) {
    return !key.empty() && std::all_of(key.begin(), key.end(),
                                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string id_string(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<int64_t>());
    return "";
}

void add_unique(std::vector<std::string>& list, const std::string& value) {
    if (std::find(list.begin(), list.end(), value) == list.end()) {
        list.push_back(value);
    }
}

std::vector<SubmittedCard> parse_submitted_deck(const json& data) {
    const json& deck = has(data, "CourseDeck") ? data["CourseDeck"] : data;
    json main = json::array();
    if (has(deck, "mainDeck")) main = deck["mainDeck"];
    else if (has(deck, "MainDeck")) main = deck["MainDeck"];

    std::vector<SubmittedCard> cards;
    if (!main.is_array()) return cards;
    for (const auto& entry : main) {
        if (entry.is_object()) {
            SubmittedCard card;
            if (has(entry, "cardId")) card.id = id_string(entry["cardId"]);
            else if (has(entry, "Id")) card.id = id_string(entry["Id"]);
            if (has(entry, "quantity") && entry["quantity"].is_number()) card.qty = entry["quantity"].get<int>();
            else if (has(entry, "Quantity") && entry["Quantity"].is_number()) card.qty = entry["Quantity"].get<int>();
            cards.push_back(std::move(card));
        } else if (entry.is_number_integer()) {
            cards.push_back(SubmittedCard{std::to_string(entry.get<int64_t>()), 1});
        }
    }
    return cards;
}

std::optional<MatchResult> parse_match_result(const json& mc) {
    std::string text;
    if (has(mc, "result") && mc["result"].is_string()) text = mc["result"].get<std::string>();
    else if (has(mc, "matchResult") && mc["matchResult"].is_string()) text = mc["matchResult"].get<std::string>();

    if (text.find("Win") != std::string::npos) return MatchResult::Win;
    if (text.find("Loss") != std::string::npos) return MatchResult::Loss;
    if (text.find("Draw") != std::string::npos) return MatchResult::Draw;
    return std::nullopt;
}

} // namespace

nlohmann::json ArenaMatch::to_json() const {
    json deck = nullptr;
    if (deck_cards) {
        deck = json::array();
        for (const auto& card : *deck_cards) {
            deck.push_back({{"id", card.id}, {"qty", card.qty}});
        }
    }
    return {
        {"matchId", match_id},
        {"playerName", player_name ? json(*player_name) : json(nullptr)},
        {"opponentName", opponent_name ? json(*opponent_name) : json(nullptr)},
        {"result", match_result_name(result)},
        {"format", format ? json(*format) : json(nullptr)},
        {"turns", turns},
        {"deckCards", deck},
        {"cardsPlayed", cards_played},
        {"opponentCardsSeen", opponent_cards_seen}
    };
}

void MatchHistoryParser::add_game_state(const json& gsm) {
    ArenaMatch& match = current_->match;

    if (has(gsm, "turnInfo") && has(gsm["turnInfo"], "turnNumber") &&
        gsm["turnInfo"]["turnNumber"].is_number()) {
        match.turns = std::max(match.turns, gsm["turnInfo"]["turnNumber"].get<int>());
    }

    if (!has(gsm, "gameObjects") || !gsm["gameObjects"].is_array()) return;
    for (const auto& go : gsm["gameObjects"]) {
        if (!has(go, "grpId") || !has(go, "ownerSeatId")) continue;
        std::string grp_id = id_string(go["grpId"]);
        if (grp_id.empty()) continue;
        int owner = go["ownerSeatId"].is_number() ? go["ownerSeatId"].get<int>() : 0;
        if (owner == 1) add_unique(match.cards_played, grp_id);
        else if (owner == 2) add_unique(match.opponent_cards_seen, grp_id);
    }
}

std::vector<ArenaMatch> MatchHistoryParser::feed(const std::vector<JsonBlock>& blocks) {
    std::vector<ArenaMatch> completed;

    for (const auto& block : blocks) {
        const std::string tag = block_tag(block);
        const json& data = block_payload(block);
        if (!data.is_object()) continue;

        if (has(data, "screenName") && data["screenName"].is_string()) {
            player_name_ = data["screenName"].get<std::string>();
        } else if (has(data, "playerName") && data["playerName"].is_string()) {
            player_name_ = data["playerName"].get<std::string>();
        }

        if (tag == "Event.DeckSubmitV3" || tag == "DeckSubmit" || tag == "DeckSubmitV3") {
            deck_ = parse_submitted_deck(data);
        }

        if (has(data, "matchId") && data["matchId"].is_string()) {
            std::string match_id = data["matchId"].get<std::string>();
            if (!current_ || current_->match.match_id != match_id) {
                // A match that never reported a result is dropped
                current_ = InProgress{};
                current_->match.match_id = match_id;
            }
        }

        if (!current_) continue;

        if (has(data, "greToClientEvent")) {
            const json& gre = data["greToClientEvent"];
            if (has(gre, "greToClientMessages") && gre["greToClientMessages"].is_array()) {
                for (const auto& msg : gre["greToClientMessages"]) {
                    if (has(msg, "gameStateMessage")) add_game_state(msg["gameStateMessage"]);
                }
            }
        } else if (has(data, "gameStateMessage")) {
            add_game_state(data["gameStateMessage"]);
        }

        bool complete = tag == "MatchComplete" || tag == "Event.MatchComplete" || has(data, "matchComplete");
        if (complete) {
            auto result = parse_match_result(has(data, "matchComplete") ? data["matchComplete"] : data);
            if (result) {
                ArenaMatch match = std::move(current_->match);
                match.result = *result;
                match.player_name = player_name_;
                match.deck_cards = deck_;
                completed.push_back(std::move(match));
            }
            current_.reset();
        }
    }
    return completed;
}

void MatchHistoryParser::reset() {
    deck_.reset();
    player_name_.reset();
    current_.reset();
}

std::vector<ArenaMatch> extract_matches(const std::vector<JsonBlock>& blocks) {
    MatchHistoryParser parser;
    return parser.feed(blocks);
}

std::optional<CardCollection> extract_collection(const std::vector<JsonBlock>& blocks) {
    std::optional<CardCollection> last;

    for (const auto& block : blocks) {
        const std::string tag = block_tag(block);
        if (tag != "PlayerInventory.GetPlayerCardsV3" && tag != "PlayerInventory_GetPlayerCardsV3") {
            continue;
        }

        const json& data = block_payload(block);
        if (!data.is_object()) continue;

        CardCollection collection;
        for (const auto& [key, value] : data.items()) {
            if (is_number_key(key) && value.is_number()) {
                collection[key] = value.get<int>();
            }
        }
        if (!collection.empty()) {
            last = std::move(collection);
        }
    }
    return last;
}

ArenaLogResult parse_arena_log(std::string_view text) {
    auto blocks = extract_json_blocks(text);
    ArenaLogResult result;
    result.matches = extract_matches(blocks);
    result.collection = extract_collection(blocks);
    return result;
}

} // namespace arena_tracker
