#include "scryfall_client.hpp"
#include "tracker_log.hpp"
#include <httplib.h>

namespace arena_tracker {

namespace {

std::optional<std::string> string_at(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) return it->get<std::string>();
    return std::nullopt;
}

std::optional<std::string> image_at(const nlohmann::json& obj, const char* size) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find("image_uris");
    if (it == obj.end()) return std::nullopt;
    return string_at(*it, size);
}

} // namespace

ScryfallClient::ScryfallClient(std::string host, std::string user_agent)
    : host_(std::move(host))
    , user_agent_(std::move(user_agent))
{
}

std::optional<ResolvedCard> ScryfallClient::fetch(int grp_id) {
    httplib::Client cli(host_);
    cli.set_connection_timeout(5, 0);
    cli.set_read_timeout(10, 0);

    httplib::Headers headers = {
        {"User-Agent", user_agent_},
        {"Accept", "application/json"}
    };

    auto res = cli.Get("/cards/arena/" + std::to_string(grp_id), headers);
    if (!res) {
        TrackerLog::warn("Scryfall", "Request for grpId " + std::to_string(grp_id) +
                         " failed: " + httplib::to_string(res.error()));
        return std::nullopt;
    }
    if (res->status == 404) {
        TrackerLog::debug("Scryfall", "No card for grpId " + std::to_string(grp_id));
        return std::nullopt;
    }
    if (res->status != 200) {
        TrackerLog::warn("Scryfall", "HTTP " + std::to_string(res->status) +
                         " for grpId " + std::to_string(grp_id));
        return std::nullopt;
    }

    auto body = nlohmann::json::parse(res->body, nullptr, false);
    if (body.is_discarded()) {
        TrackerLog::warn("Scryfall", "Invalid JSON for grpId " + std::to_string(grp_id));
        return std::nullopt;
    }
    return parse_scryfall_card(grp_id, body);
}

std::optional<ResolvedCard> parse_scryfall_card(int grp_id, const nlohmann::json& card) {
    auto name = string_at(card, "name");
    if (!name) return std::nullopt;

    nlohmann::json front;
    if (card.contains("card_faces") && card["card_faces"].is_array() && !card["card_faces"].empty()) {
        front = card["card_faces"][0];
    }

    ResolvedCard resolved;
    resolved.grp_id = grp_id;
    resolved.name = *name;

    resolved.mana_cost = string_at(card, "mana_cost");
    if (!resolved.mana_cost) resolved.mana_cost = string_at(front, "mana_cost");

    if (card.contains("cmc") && card["cmc"].is_number()) {
        resolved.cmc = card["cmc"].get<double>();
    }

    resolved.type_line = string_at(card, "type_line");

    resolved.oracle_text = string_at(card, "oracle_text");
    if (!resolved.oracle_text) resolved.oracle_text = string_at(front, "oracle_text");

    resolved.image_uri_small = image_at(card, "small");
    if (!resolved.image_uri_small) resolved.image_uri_small = image_at(front, "small");
    resolved.image_uri_normal = image_at(card, "normal");
    if (!resolved.image_uri_normal) resolved.image_uri_normal = image_at(front, "normal");

    return resolved;
}

} // namespace arena_tracker
