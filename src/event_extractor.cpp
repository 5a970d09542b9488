#include "event_extractor.hpp"
#include "tracker_log.hpp"
#include <cstdlib>
#include <unordered_set>

namespace arena_tracker {

using nlohmann::json;

namespace {

constexpr int kDefaultLife = 20;

const json& empty_array() {
    static const json arr = json::array();
    return arr;
}

const json* find_field(const json& obj, const char* key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

std::optional<int> as_int(const json& value) {
    if (value.is_number_integer() || value.is_number_unsigned()) {
        return value.get<int>();
    }
    if (value.is_number_float()) {
        return static_cast<int>(value.get<double>());
    }
    if (value.is_string()) {
        const std::string& s = value.get_ref<const std::string&>();
        char* end = nullptr;
        long parsed = std::strtol(s.c_str(), &end, 10);
        if (!s.empty() && end && *end == '\0') {
            return static_cast<int>(parsed);
        }
    }
    return std::nullopt;
}

std::optional<int> opt_int(const json& obj, const char* key) {
    const json* field = find_field(obj, key);
    return field ? as_int(*field) : std::nullopt;
}

int int_field(const json& obj, const char* key, int fallback = 0) {
    return opt_int(obj, key).value_or(fallback);
}

std::optional<std::string> opt_string(const json& obj, const char* key) {
    const json* field = find_field(obj, key);
    if (field && field->is_string()) return field->get<std::string>();
    return std::nullopt;
}

const json& array_field(const json& obj, const char* key) {
    const json* field = find_field(obj, key);
    return field && field->is_array() ? *field : empty_array();
}

// First present field among several spellings
const json* first_field(const json& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (const json* field = find_field(obj, key)) return field;
    }
    return nullptr;
}

std::vector<int> int_list(const json& arr) {
    std::vector<int> out;
    if (!arr.is_array()) return out;
    out.reserve(arr.size());
    for (const auto& v : arr) {
        if (auto n = as_int(v)) out.push_back(*n);
    }
    return out;
}

std::vector<std::string> string_list(const json& arr) {
    std::vector<std::string> out;
    if (!arr.is_array()) return out;
    for (const auto& v : arr) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

// ── Annotation helpers ──────────────────────────────────────────────────────

bool annotation_has_type(const json& annotation, const char* type) {
    const json* types = find_field(annotation, "type");
    if (!types) return false;
    if (types->is_string()) return types->get_ref<const std::string&>() == type;
    if (types->is_array()) {
        for (const auto& t : *types) {
            if (t.is_string() && t.get_ref<const std::string&>() == type) return true;
        }
    }
    return false;
}

const json* annotation_detail(const json& annotation, const char* key) {
    for (const auto& detail : array_field(annotation, "details")) {
        auto name = opt_string(detail, "key");
        if (name && *name == key) return &detail;
    }
    return nullptr;
}

std::vector<int> detail_ints(const json& annotation, const char* key) {
    const json* detail = annotation_detail(annotation, key);
    if (!detail) return {};
    const json* values = first_field(*detail, {"valueInt32", "valueUint32", "valueInt64"});
    return values ? int_list(*values) : std::vector<int>{};
}

std::optional<int> detail_int(const json& annotation, const char* key) {
    auto values = detail_ints(annotation, key);
    if (values.empty()) return std::nullopt;
    return values.front();
}

std::optional<std::string> detail_string(const json& annotation, const char* key) {
    const json* detail = annotation_detail(annotation, key);
    if (!detail) return std::nullopt;
    auto values = string_list(array_field(*detail, "valueString"));
    if (values.empty()) return std::nullopt;
    return values.front();
}

// ── Context helpers ─────────────────────────────────────────────────────────

std::string zone_type_of(const ExtractionContext& ctx, int zone_id) {
    auto it = ctx.zones.find(zone_id);
    return it != ctx.zones.end() ? it->second.type : zone_type::kUnknown;
}

void record_remap(ExtractionContext& ctx, int orig_id, int new_id) {
    if (orig_id == 0 || new_id == 0 || orig_id == new_id) return;
    ctx.id_changes[new_id] = orig_id;

    // Copy identity forward so later lookups on the new id are direct hits
    auto grp = ctx.object_grp_ids.find(orig_id);
    if (grp != ctx.object_grp_ids.end() && !ctx.object_grp_ids.count(new_id)) {
        ctx.object_grp_ids[new_id] = grp->second;
    }
    auto owner = ctx.object_owners.find(orig_id);
    if (owner != ctx.object_owners.end() && !ctx.object_owners.count(new_id)) {
        ctx.object_owners[new_id] = owner->second;
    }
    auto zone = ctx.prev_object_zones.find(orig_id);
    if (zone != ctx.prev_object_zones.end() && !ctx.prev_object_zones.count(new_id)) {
        ctx.prev_object_zones[new_id] = zone->second;
    }
}

void clear_game_tracking(ExtractionContext& ctx) {
    ctx.zones.clear();
    ctx.prev_object_zones.clear();
    ctx.object_grp_ids.clear();
    ctx.object_owners.clear();
    ctx.id_changes.clear();
    ctx.last_life_totals.clear();
    ctx.last_turn_number = 0;
    ctx.last_phase.clear();
    ctx.last_step.clear();
}

bool is_play_transfer(const std::string& from, const std::string& to, const std::optional<std::string>& category) {
    bool from_hand_or_library = from == zone_type::kHand || from == zone_type::kLibrary;
    bool to_battlefield_or_stack = to == zone_type::kBattlefield || to == zone_type::kStack;
    if (from_hand_or_library && to_battlefield_or_stack) return true;
    return from == zone_type::kStack && to == zone_type::kBattlefield && category && *category == "Resolve";
}

void emit_transfer(std::vector<ArenaGameEvent>& events, int instance_id, int grp_id, int owner,
                   int from_zone, int to_zone, const ExtractionContext& ctx,
                   std::optional<std::string> category) {
    ZoneChangeEvent change;
    change.instance_id = instance_id;
    change.grp_id = grp_id;
    change.owner_seat_id = owner;
    change.from_zone_id = from_zone;
    change.to_zone_id = to_zone;
    change.from_zone_type = zone_type_of(ctx, from_zone);
    change.to_zone_type = zone_type_of(ctx, to_zone);
    change.category = category;

    std::string from_type = change.from_zone_type;
    std::string to_type = change.to_zone_type;
    events.push_back(std::move(change));

    if (from_type == zone_type::kLibrary && to_type == zone_type::kHand) {
        events.push_back(CardDrawnEvent{instance_id, grp_id, owner});
    }
    if (is_play_transfer(from_type, to_type, category)) {
        events.push_back(CardPlayedEvent{instance_id, grp_id, owner, from_type, to_type});
    }
}

// ── Block sections ──────────────────────────────────────────────────────────

void detect_player_name(const json& data, ExtractionContext& ctx) {
    if (const json* auth = find_field(data, "authenticateResponse")) {
        if (auto name = opt_string(*auth, "screenName")) ctx.player_name = name;
    }
    if (auto name = opt_string(data, "screenName")) ctx.player_name = name;
}

void process_room_state(const json& data, ExtractionContext& ctx, std::vector<ArenaGameEvent>& events) {
    const json* event = find_field(data, "matchGameRoomStateChangedEvent");
    if (!event) return;

    const json* room_ptr = find_field(*event, "gameRoomInfo");
    const json& room = room_ptr ? *room_ptr : *event;
    const json* config = find_field(room, "gameRoomConfig");
    if (!config) return;

    auto state_type = opt_string(room, "stateType");
    bool completed = state_type && *state_type == "MatchGameRoomStateType_MatchCompleted";
    auto match_id = opt_string(*config, "matchId");
    const json& reserved = array_field(*config, "reservedPlayers");

    if (match_id && !completed) {
        MatchStartEvent start;
        start.match_id = *match_id;
        start.player_name = ctx.player_name;

        for (const auto& rp : reserved) {
            auto rp_name = opt_string(rp, "playerName");
            auto rp_seat = opt_int(rp, "systemSeatId");
            bool is_self = (ctx.player_name && rp_name == ctx.player_name) ||
                           (!ctx.player_name && rp_seat && *rp_seat == 1);
            if (is_self) {
                if (rp_name) start.player_name = rp_name;
                start.player_seat_id = rp_seat.value_or(1);
                start.player_team_id = int_field(rp, "teamId", 1);
                if (auto event_id = opt_string(rp, "eventId")) start.format = event_id;
            } else {
                start.opponent_name = rp_name;
            }
        }

        if (!start.player_name && reserved.size() >= 2) {
            start.player_name = opt_string(reserved[0], "playerName");
            start.opponent_name = opt_string(reserved[1], "playerName");
            start.player_seat_id = int_field(reserved[0], "systemSeatId", 1);
            start.player_team_id = int_field(reserved[0], "teamId", 1);
            start.format = opt_string(reserved[0], "eventId");
        }

        // A new match never inherits another match's objects
        if (ctx.current_match_id != start.match_id) {
            clear_game_tracking(ctx);
        }
        ctx.player_seat_id = start.player_seat_id;
        ctx.player_team_id = start.player_team_id;
        ctx.current_match_id = start.match_id;
        ctx.game_number = 1;
        events.push_back(std::move(start));
    }

    const json* final_result = find_field(room, "finalMatchResult");
    if (final_result && completed && ctx.current_match_id) {
        MatchCompleteEvent complete;
        complete.match_id = *ctx.current_match_id;

        for (const auto& r : array_field(*final_result, "resultList")) {
            auto scope = opt_string(r, "scope");
            if (!scope || *scope != "MatchScope_Match") continue;

            complete.winning_team_id = opt_int(r, "winningTeamId");
            auto result_type = opt_string(r, "result");
            if (result_type && *result_type == "ResultType_Draw") {
                complete.result = MatchResult::Draw;
            } else if (complete.winning_team_id && *complete.winning_team_id == ctx.player_team_id) {
                complete.result = MatchResult::Win;
            } else if (complete.winning_team_id) {
                complete.result = MatchResult::Loss;
            }
            break;
        }

        events.push_back(std::move(complete));
        ctx.current_match_id.reset();
    }
}

bool is_deck_submit_method(const std::string& tag) {
    return tag == "EventSetDeckV2" || tag == "Event.DeckSubmitV3" ||
           tag == "DeckSubmit" || tag == "DeckSubmitV3";
}

std::vector<DeckCard> parse_deck_entries(const json& entries) {
    std::vector<DeckCard> cards;
    if (!entries.is_array()) return cards;
    for (const auto& entry : entries) {
        if (entry.is_object()) {
            const json* id = first_field(entry, {"cardId", "Id"});
            const json* qty = first_field(entry, {"quantity", "Quantity"});
            int grp_id = id ? as_int(*id).value_or(0) : 0;
            int count = qty ? as_int(*qty).value_or(1) : 1;
            if (grp_id > 0) cards.push_back(DeckCard{grp_id, count});
        } else if (auto grp_id = as_int(entry); grp_id && entry.is_number()) {
            cards.push_back(DeckCard{*grp_id, 1});
        }
    }
    return cards;
}

void process_deck_submit(const std::string& tag, const json& data, std::vector<ArenaGameEvent>& events) {
    if (!is_deck_submit_method(tag)) return;

    const json* request = find_field(data, "_parsed_request");
    const json& req = request ? *request : data;
    const json* deck_ptr = first_field(req, {"Deck", "deck", "CourseDeck"});
    const json& deck = deck_ptr ? *deck_ptr : req;

    const json* main = first_field(deck, {"MainDeck", "mainDeck"});
    const json* side = first_field(deck, {"Sideboard", "sideboard", "SideboardCards"});
    const json* command = first_field(deck, {"CommandZone", "commandZone"});

    DeckSubmissionEvent submission;
    submission.deck_cards = parse_deck_entries(main ? *main : empty_array());
    submission.sideboard_cards = parse_deck_entries(side ? *side : empty_array());
    for (const auto& card : parse_deck_entries(command ? *command : empty_array())) {
        submission.commander_grp_ids.push_back(card.grp_id);
    }

    if (!submission.deck_cards.empty()) {
        events.push_back(std::move(submission));
    }
}

void process_connect_response(const json& msg, std::vector<ArenaGameEvent>& events) {
    const json* resp = find_field(msg, "connectResp");
    if (!resp) return;
    const json* deck_msg = find_field(*resp, "deckMessage");
    if (!deck_msg) return;

    DeckSubmissionEvent submission;
    submission.commander_grp_ids = int_list(array_field(*deck_msg, "commanderCards"));

    // Merge deck + commander ids, counting duplicates in first-seen order
    std::unordered_map<int, std::size_t> index;
    auto add = [&](int grp_id) {
        auto it = index.find(grp_id);
        if (it != index.end()) {
            submission.deck_cards[it->second].qty++;
        } else {
            index[grp_id] = submission.deck_cards.size();
            submission.deck_cards.push_back(DeckCard{grp_id, 1});
        }
    };
    for (int id : int_list(array_field(*deck_msg, "deckCards"))) add(id);
    for (int id : submission.commander_grp_ids) add(id);

    events.push_back(std::move(submission));
}

void apply_deletions(const json& gsm, ExtractionContext& ctx) {
    for (int id : int_list(array_field(gsm, "diffDeletedInstanceIds"))) {
        ctx.object_grp_ids.erase(id);
        ctx.object_owners.erase(id);
        ctx.prev_object_zones.erase(id);
        ctx.id_changes.erase(id);
        ctx.stats.diff_deleted++;
    }
}

std::vector<ZoneInfo> apply_zones(const json& gsm, ExtractionContext& ctx) {
    std::vector<ZoneInfo> zones;
    for (const auto& z : array_field(gsm, "zones")) {
        auto zone_id = opt_int(z, "zoneId");
        if (!zone_id) continue;

        ZoneInfo info;
        info.zone_id = *zone_id;
        info.type = opt_string(z, "type").value_or("");
        info.owner_seat_id = int_field(z, "ownerSeatId");
        if (const json* ids = find_field(z, "objectInstanceIds")) {
            info.object_instance_ids = int_list(*ids);
        }
        ctx.zones[info.zone_id] = ZoneEntry{info.type, info.owner_seat_id};
        zones.push_back(std::move(info));
    }
    return zones;
}

std::unordered_set<int> annotated_transfers(const json& gsm) {
    std::unordered_set<int> ids;
    for (const auto& annotation : array_field(gsm, "annotations")) {
        if (annotation_has_type(annotation, "AnnotationType_ZoneTransfer")) {
            for (int id : int_list(array_field(annotation, "affectedIds"))) ids.insert(id);
        }
    }
    return ids;
}

std::vector<GameObjectInfo> apply_objects(const json& gsm, ExtractionContext& ctx,
                                          std::vector<ArenaGameEvent>& events) {
    const auto annotated = annotated_transfers(gsm);
    std::vector<GameObjectInfo> objects;

    for (const auto& go : array_field(gsm, "gameObjects")) {
        GameObjectInfo info;
        info.instance_id = int_field(go, "instanceId");
        info.grp_id = int_field(go, "grpId");
        if (info.instance_id == 0 || info.grp_id == 0) continue;

        info.owner_seat_id = int_field(go, "ownerSeatId");
        info.controller_seat_id = int_field(go, "controllerSeatId", info.owner_seat_id);
        info.zone_id = int_field(go, "zoneId");
        info.visibility = opt_string(go, "visibility").value_or("Visibility_Public");
        info.card_types = string_list(array_field(go, "cardTypes"));
        info.subtypes = string_list(array_field(go, "subtypes"));
        if (const json* name = find_field(go, "name")) {
            if (name->is_string()) info.name = name->get<std::string>();
            else if (auto n = as_int(*name)) info.name = std::to_string(*n);
        }

        ctx.object_grp_ids[info.instance_id] = info.grp_id;
        ctx.object_owners[info.instance_id] = info.owner_seat_id;

        // Objects that moved without an accompanying ZoneTransfer annotation
        auto prev = ctx.prev_object_zones.find(info.instance_id);
        if (prev != ctx.prev_object_zones.end() && prev->second != info.zone_id &&
            !annotated.count(info.instance_id)) {
            emit_transfer(events, info.instance_id, info.grp_id, info.owner_seat_id,
                          prev->second, info.zone_id, ctx, std::nullopt);
        }
        ctx.prev_object_zones[info.instance_id] = info.zone_id;

        objects.push_back(std::move(info));
    }
    return objects;
}

void apply_object_id_changes(const json& annotations, ExtractionContext& ctx) {
    for (const auto& annotation : annotations) {
        if (!annotation_has_type(annotation, "AnnotationType_ObjectIdChanged")) continue;
        auto orig = detail_int(annotation, "orig_id");
        auto next = detail_int(annotation, "new_id");
        if (!orig || !next) continue;
        record_remap(ctx, *orig, *next);
        ctx.stats.object_id_changes++;
    }
}

void apply_shuffles(const json& annotations, ExtractionContext& ctx) {
    for (const auto& annotation : annotations) {
        if (!annotation_has_type(annotation, "AnnotationType_Shuffle")) continue;
        auto old_ids = detail_ints(annotation, "OldIds");
        auto new_ids = detail_ints(annotation, "NewIds");
        if (old_ids.size() != new_ids.size()) {
            TrackerLog::debug("Extractor", "Shuffle with mismatched id lists ignored");
            continue;
        }
        for (std::size_t i = 0; i < old_ids.size(); ++i) {
            record_remap(ctx, old_ids[i], new_ids[i]);
            ctx.stats.shuffle_remaps++;
        }
    }
}

void apply_zone_transfers(const json& annotations, ExtractionContext& ctx,
                          std::vector<ArenaGameEvent>& events) {
    for (const auto& annotation : annotations) {
        if (!annotation_has_type(annotation, "AnnotationType_ZoneTransfer")) continue;

        auto dest = detail_int(annotation, "zone_dest");
        auto src = detail_int(annotation, "zone_src");
        auto category = detail_string(annotation, "category");

        for (int instance_id : int_list(array_field(annotation, "affectedIds"))) {
            ctx.stats.zone_transfers++;
            auto resolved = resolve_identity(instance_id, ctx);
            if (!resolved) {
                ctx.stats.grp_id_misses++;
                continue;
            }
            ctx.stats.grp_id_hits++;

            int from_zone = src.value_or(0);
            if (!src) {
                auto prev = ctx.prev_object_zones.find(instance_id);
                if (prev != ctx.prev_object_zones.end()) from_zone = prev->second;
            }
            if (!dest) continue;

            emit_transfer(events, instance_id, resolved->grp_id, resolved->owner_seat_id,
                          from_zone, *dest, ctx, category);

            ctx.object_grp_ids[instance_id] = resolved->grp_id;
            ctx.object_owners[instance_id] = resolved->owner_seat_id;
            ctx.prev_object_zones[instance_id] = *dest;
        }
    }
}

void apply_life_modifications(const json& annotations, ExtractionContext& ctx,
                              std::vector<ArenaGameEvent>& events) {
    for (const auto& annotation : annotations) {
        if (!annotation_has_type(annotation, "AnnotationType_ModifiedLife")) continue;
        int delta = detail_int(annotation, "life").value_or(0);
        if (delta == 0) continue;

        for (int seat : int_list(array_field(annotation, "affectedIds"))) {
            auto it = ctx.last_life_totals.find(seat);
            int base = it != ctx.last_life_totals.end() ? it->second : kDefaultLife;
            int total = base + delta;
            ctx.last_life_totals[seat] = total;
            ctx.stats.life_changes++;
            events.push_back(LifeTotalChangeEvent{seat, total});
        }
    }
}

void apply_damage(const json& annotations, ExtractionContext& ctx,
                  std::vector<ArenaGameEvent>& events) {
    for (const auto& annotation : annotations) {
        if (!annotation_has_type(annotation, "AnnotationType_DamageDealt")) continue;
        int amount = detail_int(annotation, "damage_amount").value_or(0);
        if (amount <= 0) continue;

        auto source_id = opt_int(annotation, "affectorId");
        auto source = source_id ? resolve_identity(*source_id, ctx) : std::nullopt;
        if (!source) {
            ctx.stats.grp_id_misses++;
            continue;
        }

        for (int target : int_list(array_field(annotation, "affectedIds"))) {
            DamageDealtEvent damage;
            damage.source_instance_id = *source_id;
            damage.source_grp_id = source->grp_id;
            damage.amount = amount;
            if (auto target_card = resolve_identity(target, ctx)) {
                damage.target_grp_id = target_card->grp_id;
            } else {
                damage.target_seat_id = target;
            }
            ctx.stats.damage_events++;
            events.push_back(std::move(damage));
        }
    }
}

std::optional<TurnInfo> apply_turn_info(const json& gsm, ExtractionContext& ctx,
                                        std::vector<ArenaGameEvent>& events) {
    const json* turn = find_field(gsm, "turnInfo");
    if (!turn) return std::nullopt;

    TurnInfo info;
    info.turn_number = int_field(*turn, "turnNumber");
    info.active_player = int_field(*turn, "activePlayer");
    info.phase = opt_string(*turn, "phase").value_or("");
    info.step = opt_string(*turn, "step").value_or("");

    if (info.turn_number > 0 && info.turn_number != ctx.last_turn_number) {
        ctx.last_turn_number = info.turn_number;
        events.push_back(TurnChangeEvent{info.turn_number, info.active_player});
    }

    if (!info.phase.empty() && (info.phase != ctx.last_phase || info.step != ctx.last_step)) {
        ctx.last_phase = info.phase;
        ctx.last_step = info.step;
        events.push_back(PhaseChangeEvent{info.phase, info.step, ctx.last_turn_number});
    }
    return info;
}

std::vector<PlayerInfo> apply_players(const json& gsm, ExtractionContext& ctx,
                                      std::vector<ArenaGameEvent>& events) {
    std::vector<PlayerInfo> players;
    for (const auto& p : array_field(gsm, "players")) {
        const json* seat_field = first_field(p, {"systemSeatNumber", "systemSeatId", "seatId"});
        auto seat = seat_field ? as_int(*seat_field) : std::nullopt;
        auto life = opt_int(p, "lifeTotal");
        if (!seat || *seat == 0 || !life) continue;

        players.push_back(PlayerInfo{*seat, *life, opt_int(p, "teamId")});

        // Shares last-known totals with ModifiedLife so neither path re-emits
        auto it = ctx.last_life_totals.find(*seat);
        if (it != ctx.last_life_totals.end() && it->second != *life) {
            events.push_back(LifeTotalChangeEvent{*seat, *life});
        }
        ctx.last_life_totals[*seat] = *life;
    }
    return players;
}

void backfill_mulligan_hand(const std::vector<ZoneInfo>& zones, const std::optional<TurnInfo>& turn,
                            const ExtractionContext& ctx, std::vector<ArenaGameEvent>& events) {
    if (!turn || turn->phase != "Phase_Beginning" || ctx.last_turn_number > 1) return;

    for (const auto& zone : zones) {
        if (zone.type != zone_type::kHand || zone.owner_seat_id != ctx.player_seat_id ||
            !zone.object_instance_ids) {
            continue;
        }

        std::vector<int> hand;
        for (int id : *zone.object_instance_ids) {
            auto it = ctx.object_grp_ids.find(id);
            if (it != ctx.object_grp_ids.end() && it->second != 0) hand.push_back(it->second);
        }

        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            auto* prompt = std::get_if<MulliganPromptEvent>(&*it);
            if (prompt && prompt->hand_grp_ids.empty()) {
                prompt->hand_grp_ids = hand;
                break;
            }
        }
    }
}

void process_game_state(const json& gsm, ExtractionContext& ctx, std::vector<ArenaGameEvent>& events) {
    ctx.stats.gsm_count++;

    apply_deletions(gsm, ctx);

    GameStateUpdateEvent update;
    update.zones = apply_zones(gsm, ctx);
    update.game_objects = apply_objects(gsm, ctx, events);

    // Order matters: remaps must be visible to transfers in the same diff
    const json& annotations = array_field(gsm, "annotations");
    apply_object_id_changes(annotations, ctx);
    apply_shuffles(annotations, ctx);
    apply_zone_transfers(annotations, ctx, events);
    apply_life_modifications(annotations, ctx, events);
    apply_damage(annotations, ctx, events);

    update.turn_info = apply_turn_info(gsm, ctx, events);
    update.players = apply_players(gsm, ctx, events);

    auto zones = update.zones;
    auto turn = update.turn_info;
    events.push_back(std::move(update));

    backfill_mulligan_hand(zones, turn, ctx, events);
}

void process_gre_event(const json& data, ExtractionContext& ctx, std::vector<ArenaGameEvent>& events) {
    const json* gre = find_field(data, "greToClientEvent");
    if (!gre) return;

    for (const auto& msg : array_field(*gre, "greToClientMessages")) {
        auto msg_type = opt_string(msg, "type").value_or("");

        process_connect_response(msg, events);

        if (msg_type == "GREMessageType_MulliganReq" || msg_type == "GREMessageType_GroupReq") {
            if (const json* prompt = find_field(msg, "mulliganReq")) {
                MulliganPromptEvent mulligan;
                mulligan.seat_id = int_field(*prompt, "systemSeatId", ctx.player_seat_id);
                mulligan.mulligan_count = int_field(*prompt, "mulliganCount");
                events.push_back(std::move(mulligan));
            }
        }

        if (msg_type == "GREMessageType_IntermissionReq") {
            ctx.game_number++;
            clear_game_tracking(ctx);
            events.push_back(IntermissionEvent{ctx.game_number});
        }

        if (const json* gsm = find_field(msg, "gameStateMessage")) {
            process_game_state(*gsm, ctx, events);
        }
    }
}

void extract_into(const JsonBlock& block, ExtractionContext& ctx, std::vector<ArenaGameEvent>& events) {
    const json& data = block_payload(block);
    if (!data.is_object()) return;

    detect_player_name(data, ctx);
    process_room_state(data, ctx, events);
    process_deck_submit(block_tag(block), data, events);
    process_gre_event(data, ctx, events);
}

} // namespace

std::optional<ResolvedInstance> resolve_identity(int instance_id, const ExtractionContext& ctx) {
    std::unordered_set<int> visited;
    int current = instance_id;

    while (current != 0 && visited.insert(current).second) {
        auto grp = ctx.object_grp_ids.find(current);
        if (grp != ctx.object_grp_ids.end() && grp->second != 0) {
            auto owner = ctx.object_owners.find(current);
            return ResolvedInstance{current, grp->second,
                                    owner != ctx.object_owners.end() ? owner->second : 0};
        }
        auto prev = ctx.id_changes.find(current);
        if (prev == ctx.id_changes.end()) break;
        current = prev->second;
    }
    return std::nullopt;
}

std::vector<ArenaGameEvent> extract_events(const JsonBlock& block, ExtractionContext& ctx) {
    std::vector<ArenaGameEvent> events;
    extract_into(block, ctx, events);
    return events;
}

std::vector<ArenaGameEvent> extract_events(const std::vector<JsonBlock>& blocks, ExtractionContext& ctx) {
    std::vector<ArenaGameEvent> events;
    for (const auto& block : blocks) {
        extract_into(block, ctx, events);
    }
    return events;
}

} // namespace arena_tracker
