#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace arena_tracker {

struct ResolvedCard {
    int grp_id = 0;
    std::string name;
    std::optional<std::string> mana_cost;
    double cmc = 0.0;
    std::optional<std::string> type_line;
    std::optional<std::string> oracle_text;
    std::optional<std::string> image_uri_small;
    std::optional<std::string> image_uri_normal;

    nlohmann::json to_json() const {
        auto opt = [](const std::optional<std::string>& v) {
            return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
        };
        return {
            {"grpId", grp_id},
            {"name", name},
            {"manaCost", opt(mana_cost)},
            {"cmc", cmc},
            {"typeLine", opt(type_line)},
            {"oracleText", opt(oracle_text)},
            {"imageUriSmall", opt(image_uri_small)},
            {"imageUriNormal", opt(image_uri_normal)}
        };
    }
};

// Remote card metadata lookup by Arena grpId.
// Implementations return nullopt for unknown ids and for transport failures.
class CardLookupClient {
public:
    virtual ~CardLookupClient() = default;
    virtual std::optional<ResolvedCard> fetch(int grp_id) = 0;
};

} // namespace arena_tracker
