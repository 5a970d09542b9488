#pragma once

#include "card_lookup_client.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace arena_tracker {

// Looks cards up by Arena id on api.scryfall.com (GET /cards/arena/{id})
class ScryfallClient : public CardLookupClient {
public:
    explicit ScryfallClient(std::string host = "https://api.scryfall.com",
                            std::string user_agent = "ArenaTracker/1.0");

    std::optional<ResolvedCard> fetch(int grp_id) override;

private:
    std::string host_;
    std::string user_agent_;
};

// Maps a Scryfall card object onto ResolvedCard. Double-faced cards fall
// back to card_faces[0] for cost, text and images.
std::optional<ResolvedCard> parse_scryfall_card(int grp_id, const nlohmann::json& card);

} // namespace arena_tracker
