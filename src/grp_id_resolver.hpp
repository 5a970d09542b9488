#pragma once

#include "card_lookup_client.hpp"
#include "sqlite_adapter.hpp"
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace arena_tracker {

// True for the name given to ids no tier could resolve
bool is_placeholder_name(const std::string& name);

// Resolves Arena grpIds to card metadata.
//
// Lookup order:
//   1. in-process cache
//   2. grp_id_cache table
//   3. cards.arena_id catalog match (written back as source "arena_id")
//   4. remote lookup, rate limited (written back as source "scryfall")
// An id found nowhere resolves to "Unknown (grpId: N)", cached in memory.
//
// resolve() is safe to call from several threads. Concurrent calls for the
// same id share one lookup.
class GrpIdResolver {
public:
    static constexpr std::chrono::milliseconds kDefaultRemoteInterval{100};

    GrpIdResolver(std::shared_ptr<SqliteAdapter> db = nullptr,
                  std::shared_ptr<CardLookupClient> remote = nullptr,
                  std::chrono::milliseconds remote_interval = kDefaultRemoteInterval);

    GrpIdResolver(const GrpIdResolver&) = delete;
    GrpIdResolver& operator=(const GrpIdResolver&) = delete;

    ResolvedCard resolve(int grp_id);
    std::map<int, ResolvedCard> resolve_many(const std::vector<int>& grp_ids);

    // Memory only, never touches storage or the network
    std::optional<ResolvedCard> get_cached(int grp_id) const;

    // Bulk-load persisted rows for ids not already in memory
    void warm_cache(const std::vector<int>& grp_ids);

    // Persist names learned from game objects where no cached row exists
    void set_name_hints(const std::unordered_map<int, std::string>& names);

    size_t cache_size() const;

    static ResolvedCard placeholder(int grp_id);

private:
    ResolvedCard resolve_uncached(int grp_id);
    std::optional<ResolvedCard> lookup_cache_table(int grp_id);
    std::optional<ResolvedCard> lookup_catalog(int grp_id);
    std::optional<ResolvedCard> lookup_remote(int grp_id);
    void store(const ResolvedCard& card, const std::string& source);
    void remember(const ResolvedCard& card);
    void wait_for_remote_slot();

    std::shared_ptr<SqliteAdapter> db_;
    std::shared_ptr<CardLookupClient> remote_;
    std::chrono::milliseconds remote_interval_;

    mutable std::mutex mutex_;   // guards cache_ and pending_
    std::unordered_map<int, ResolvedCard> cache_;
    std::unordered_map<int, std::shared_future<ResolvedCard>> pending_;

    std::mutex rate_mutex_;
    std::chrono::steady_clock::time_point last_remote_{};
};

} // namespace arena_tracker
