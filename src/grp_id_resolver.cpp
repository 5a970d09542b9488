#include "grp_id_resolver.hpp"
#include "game_state.hpp"
#include "tracker_log.hpp"
#include <thread>

namespace arena_tracker {

namespace {

SqlValue text_or_null(const std::optional<std::string>& value) {
    if (value) return *value;
    return nullptr;
}

ResolvedCard card_from_row(int grp_id, const SqlRow& row, const char* name_column) {
    ResolvedCard card;
    card.grp_id = grp_id;
    card.name = row_text(row, name_column).value_or("");
    card.mana_cost = row_text(row, "mana_cost");
    card.cmc = row_real(row, "cmc").value_or(0.0);
    card.type_line = row_text(row, "type_line");
    card.oracle_text = row_text(row, "oracle_text");
    card.image_uri_small = row_text(row, "image_uri_small");
    card.image_uri_normal = row_text(row, "image_uri_normal");
    return card;
}

} // namespace

GrpIdResolver::GrpIdResolver(std::shared_ptr<SqliteAdapter> db,
                             std::shared_ptr<CardLookupClient> remote,
                             std::chrono::milliseconds remote_interval)
    : db_(std::move(db))
    , remote_(std::move(remote))
    , remote_interval_(remote_interval)
{
}

bool is_placeholder_name(const std::string& name) {
    return name.rfind("Unknown (grpId: ", 0) == 0;
}

ResolvedCard GrpIdResolver::placeholder(int grp_id) {
    ResolvedCard card;
    card.grp_id = grp_id;
    card.name = "Unknown (grpId: " + std::to_string(grp_id) + ")";
    return card;
}

ResolvedCard GrpIdResolver::resolve(int grp_id) {
    std::promise<ResolvedCard> promise;
    std::shared_future<ResolvedCard> in_flight;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto cached = cache_.find(grp_id);
        if (cached != cache_.end()) return cached->second;

        auto pending = pending_.find(grp_id);
        if (pending != pending_.end()) {
            in_flight = pending->second;
        } else {
            pending_[grp_id] = promise.get_future().share();
        }
    }

    // Another caller owns the lookup for this id
    if (in_flight.valid()) {
        return in_flight.get();
    }

    try {
        ResolvedCard result = resolve_uncached(grp_id);
        promise.set_value(result);
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(grp_id);
        return result;
    } catch (const std::exception& e) {
        TrackerLog::error("Resolver", "Resolution of grpId " + std::to_string(grp_id) +
                          " failed: " + e.what());
        promise.set_exception(std::current_exception());
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(grp_id);
        throw;
    }
}

std::map<int, ResolvedCard> GrpIdResolver::resolve_many(const std::vector<int>& grp_ids) {
    std::map<int, ResolvedCard> results;
    std::vector<std::pair<int, std::future<ResolvedCard>>> tasks;

    for (int grp_id : grp_ids) {
        if (results.count(grp_id)) continue;
        if (auto cached = get_cached(grp_id)) {
            results[grp_id] = *cached;
            continue;
        }
        tasks.emplace_back(grp_id, std::async(std::launch::async, [this, grp_id]() {
            return resolve(grp_id);
        }));
    }

    for (auto& [grp_id, task] : tasks) {
        results[grp_id] = task.get();
    }
    return results;
}

std::optional<ResolvedCard> GrpIdResolver::get_cached(int grp_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(grp_id);
    if (it == cache_.end()) return std::nullopt;
    return it->second;
}

void GrpIdResolver::warm_cache(const std::vector<int>& grp_ids) {
    if (!db_) return;

    int loaded = 0;
    for (int grp_id : grp_ids) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cache_.count(grp_id)) continue;
        }
        if (auto card = lookup_cache_table(grp_id)) {
            remember(*card);
            ++loaded;
        }
    }
    TrackerLog::debug("Resolver", "Warmed " + std::to_string(loaded) + " of " +
                      std::to_string(grp_ids.size()) + " ids");
}

void GrpIdResolver::set_name_hints(const std::unordered_map<int, std::string>& names) {
    if (!db_ || names.empty()) return;

    try {
        int stored = 0;
        db_->transaction([&]() {
            for (const auto& [grp_id, name] : names) {
                if (grp_id == 0 || name.empty() || is_numeric_name(name)) continue;
                stored += db_->execute(
                    "INSERT OR IGNORE INTO grp_id_cache (grp_id, card_name, source) VALUES (?, ?, ?)",
                    {static_cast<int64_t>(grp_id), name, std::string("game_object")});
            }
        });
        if (stored > 0) {
            TrackerLog::debug("Resolver", "Stored " + std::to_string(stored) + " name hints");
        }
    } catch (const std::exception& e) {
        TrackerLog::warn("Resolver", std::string("Failed to store name hints: ") + e.what());
    }
}

size_t GrpIdResolver::cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

// ── Tiers ───────────────────────────────────────────────────────────────────

ResolvedCard GrpIdResolver::resolve_uncached(int grp_id) {
    if (auto card = lookup_cache_table(grp_id)) {
        remember(*card);
        return *card;
    }

    if (auto card = lookup_catalog(grp_id)) {
        remember(*card);
        store(*card, "arena_id");
        return *card;
    }

    if (auto card = lookup_remote(grp_id)) {
        remember(*card);
        store(*card, "scryfall");
        return *card;
    }

    // Cached so the remote is not asked again this session
    ResolvedCard unknown = placeholder(grp_id);
    remember(unknown);
    return unknown;
}

std::optional<ResolvedCard> GrpIdResolver::lookup_cache_table(int grp_id) {
    if (!db_) return std::nullopt;
    try {
        auto row = db_->query_one("SELECT * FROM grp_id_cache WHERE grp_id = ?",
                                  {static_cast<int64_t>(grp_id)});
        if (!row) return std::nullopt;
        return card_from_row(grp_id, *row, "card_name");
    } catch (const std::exception& e) {
        TrackerLog::warn("Resolver", std::string("grp_id_cache lookup failed: ") + e.what());
        return std::nullopt;
    }
}

std::optional<ResolvedCard> GrpIdResolver::lookup_catalog(int grp_id) {
    if (!db_) return std::nullopt;
    try {
        auto row = db_->query_one(R"(
            SELECT id, name, mana_cost, cmc, type_line, oracle_text,
                   image_uri_small, image_uri_normal
            FROM cards WHERE arena_id = ? LIMIT 1
        )", {static_cast<int64_t>(grp_id)});
        if (!row) return std::nullopt;
        return card_from_row(grp_id, *row, "name");
    } catch (const std::exception& e) {
        TrackerLog::warn("Resolver", std::string("Catalog lookup failed: ") + e.what());
        return std::nullopt;
    }
}

std::optional<ResolvedCard> GrpIdResolver::lookup_remote(int grp_id) {
    if (!remote_) return std::nullopt;

    wait_for_remote_slot();
    try {
        return remote_->fetch(grp_id);
    } catch (const std::exception& e) {
        TrackerLog::warn("Resolver", "Remote lookup for grpId " + std::to_string(grp_id) +
                         " failed: " + e.what());
        return std::nullopt;
    }
}

void GrpIdResolver::wait_for_remote_slot() {
    std::lock_guard<std::mutex> lock(rate_mutex_);
    auto now = std::chrono::steady_clock::now();
    auto next = last_remote_ + remote_interval_;
    if (now < next) {
        std::this_thread::sleep_for(next - now);
    }
    last_remote_ = std::chrono::steady_clock::now();
}

void GrpIdResolver::store(const ResolvedCard& card, const std::string& source) {
    if (!db_) return;
    try {
        db_->execute(R"(
            INSERT OR REPLACE INTO grp_id_cache
            (grp_id, card_name, image_uri_small, image_uri_normal, mana_cost, cmc, type_line, oracle_text, source)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        )", {
            static_cast<int64_t>(card.grp_id),
            card.name,
            text_or_null(card.image_uri_small),
            text_or_null(card.image_uri_normal),
            text_or_null(card.mana_cost),
            card.cmc,
            text_or_null(card.type_line),
            text_or_null(card.oracle_text),
            source
        });
    } catch (const std::exception& e) {
        TrackerLog::warn("Resolver", "Failed to cache grpId " + std::to_string(card.grp_id) +
                         ": " + e.what());
    }
}

void GrpIdResolver::remember(const ResolvedCard& card) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_[card.grp_id] = card;
}

} // namespace arena_tracker
