#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace arena_tracker {

struct ZoneEntry {
    std::string type;
    int owner_seat_id = 0;
};

// Counters describing how well game-state diffs are being decoded
struct ExtractionStats {
    int gsm_count = 0;
    int zone_transfers = 0;
    int grp_id_hits = 0;
    int grp_id_misses = 0;
    int object_id_changes = 0;
    int shuffle_remaps = 0;
    int diff_deleted = 0;
    int life_changes = 0;
    int damage_events = 0;

    nlohmann::json to_json() const {
        return {
            {"gsmCount", gsm_count},
            {"zoneTransfers", zone_transfers},
            {"grpIdHits", grp_id_hits},
            {"grpIdMisses", grp_id_misses},
            {"objectIdChanges", object_id_changes},
            {"shuffleRemaps", shuffle_remaps},
            {"diffDeleted", diff_deleted},
            {"lifeChanges", life_changes},
            {"damageEvents", damage_events}
        };
    }
};

// Decode state carried across polls for one watcher lifetime
struct ExtractionContext {
    std::optional<std::string> player_name;
    int player_seat_id = 1;
    int player_team_id = 1;
    std::optional<std::string> current_match_id;

    std::unordered_map<int, ZoneEntry> zones;          // zoneId -> zone
    std::unordered_map<int, int> prev_object_zones;    // instanceId -> zoneId
    std::unordered_map<int, int> object_grp_ids;       // instanceId -> grpId
    std::unordered_map<int, int> object_owners;        // instanceId -> seat
    std::unordered_map<int, int> id_changes;           // newId -> origId

    std::unordered_map<int, int> last_life_totals;     // seat -> life
    int last_turn_number = 0;
    std::string last_phase;
    std::string last_step;
    int game_number = 1;

    ExtractionStats stats;

    void reset() { *this = ExtractionContext{}; }
};

} // namespace arena_tracker
