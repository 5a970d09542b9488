#include "arena_log_watcher.hpp"
#include "tracker_log.hpp"
#include <algorithm>
#include <map>
#include <sstream>

namespace arena_tracker {

ArenaLogWatcher::ArenaLogWatcher(WatcherOptions options, WatcherCallbacks callbacks)
    : options_(std::move(options))
    , callbacks_(std::move(callbacks))
    , timer_(io_context_)
    , tailer_(options_.log_path, options_.catch_up, options_.catch_up_window)
{
    tailer_.set_chunk_callback([this](const std::string& chunk) { on_chunk(chunk); });
    tailer_.set_reset_callback([this](ResetReason reason) { on_reset(reason); });
    game_log_.set_listener([this](const GameLogEntry& entry, bool collapsed) {
        unreported_log_.emplace_back(entry, collapsed);
    });
}

ArenaLogWatcher::~ArenaLogWatcher() {
    stop();
}

void ArenaLogWatcher::start(bool background) {
    if (running_) return;
    running_ = true;
    background_ = background;

    if (io_context_.stopped()) {
        io_context_.restart();
    }

    TrackerLog::log("Watcher", "Watching " + options_.log_path +
                    (options_.catch_up ? " (catch-up)" : ""));

    if (!background_) {
        tailer_.start();
        return;
    }

    // Catch-up delivery happens on the poll thread like every other chunk
    asio::post(io_context_, [this]() {
        if (!running_) return;
        tailer_.start();
        schedule_poll();
    });
    thread_ = std::thread([this]() {
        io_context_.run();
    });
}

void ArenaLogWatcher::stop() {
    if (!running_.exchange(false)) return;

    timer_.cancel();
    io_context_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }

    wait_for_resolutions();

    tailer_.stop();
    history_.reset();
    extractor_.reset();
    context_.reset();
    engine_.reset();
    recorder_.reset();
    ++engine_generation_;

    TrackerLog::log("Watcher", "Stopped");
}

PollStatus ArenaLogWatcher::poll_once() {
    if (!running_) return PollStatus::NoChange;
    run_posted();
    return poll_tailer();
}

void ArenaLogWatcher::wait_for_resolutions() {
    std::vector<std::future<void>> outstanding;
    {
        std::lock_guard<std::mutex> lock(resolutions_mutex_);
        outstanding.swap(resolutions_);
    }
    for (auto& task : outstanding) {
        task.wait();
    }
    if (!background_ && running_) {
        run_posted();
    }
}

std::optional<GameStateSnapshot> ArenaLogWatcher::game_state() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return latest_snapshot_;
}

std::vector<GameLogEntry> ArenaLogWatcher::log_history() const {
    std::lock_guard<std::mutex> lock(game_log_mutex_);
    return game_log_.history();
}

std::optional<LastMatchInfo> ArenaLogWatcher::last_match_info() const {
    std::lock_guard<std::mutex> lock(game_log_mutex_);
    return game_log_.last_match();
}

// ── Poll loop ───────────────────────────────────────────────────────────────

void ArenaLogWatcher::schedule_poll() {
    timer_.expires_after(options_.poll_interval);
    timer_.async_wait([this](const asio::error_code& error) {
        if (error || !running_) return;
        poll_tailer();
        schedule_poll();
    });
}

PollStatus ArenaLogWatcher::poll_tailer() {
    PollStatus status = tailer_.poll();
    if (status == PollStatus::Error) {
        report_error(tailer_.last_error());
    }
    return status;
}

void ArenaLogWatcher::run_posted() {
    if (io_context_.stopped()) {
        io_context_.restart();
    }
    io_context_.poll();
}

void ArenaLogWatcher::on_chunk(const std::string& chunk) {
    try {
        auto blocks = extractor_.append(chunk);
        if (blocks.empty()) return;
        process_legacy(blocks);
        process_streaming(blocks);
    } catch (const std::exception& e) {
        report_error(std::string("Failed to process log chunk: ") + e.what());
    }
}

void ArenaLogWatcher::on_reset(ResetReason reason) {
    TrackerLog::log("Watcher", std::string("Log ") + reset_reason_name(reason) +
                    ", clearing decode state");
    history_.reset();
    extractor_.reset();
    context_.reset();
}

// ── Legacy match records ────────────────────────────────────────────────────

void ArenaLogWatcher::process_legacy(const std::vector<JsonBlock>& blocks) {
    for (const auto& match : history_.feed(blocks)) {
        if (!seen_match_ids_.insert(match.match_id).second) continue;
        ++match_count_;
        TrackerLog::log("Watcher", "Match " + match.match_id + ": " + match_result_name(match.result));
        if (callbacks_.on_match) callbacks_.on_match(match);
    }

    auto collection = extract_collection(blocks);
    if (collection && callbacks_.on_collection) {
        callbacks_.on_collection(*collection);
    }
}

// ── Live events ─────────────────────────────────────────────────────────────

void ArenaLogWatcher::process_streaming(const std::vector<JsonBlock>& blocks) {
    auto events = extract_events(blocks, context_);

    if (TrackerLog::level() == LogLevel::Debug) {
        std::map<std::string, int> counts;
        for (const auto& event : events) counts[event_type_name(event)]++;

        std::ostringstream line;
        line << blocks.size() << " blocks -> " << events.size() << " events [";
        bool first = true;
        for (const auto& [type, count] : counts) {
            line << (first ? "" : ", ") << type << ":" << count;
            first = false;
        }
        const auto& s = context_.stats;
        line << "] gsm:" << s.gsm_count << " zt:" << s.zone_transfers
             << " (hit:" << s.grp_id_hits << "/miss:" << s.grp_id_misses << ")"
             << " oid:" << s.object_id_changes << " shuf:" << s.shuffle_remaps
             << " del:" << s.diff_deleted;
        TrackerLog::debug("Watcher", line.str());
    }

    for (const auto& event : events) {
        handle_event(event);
    }
}

void ArenaLogWatcher::begin_match(const std::string& match_id,
                                  const std::optional<std::string>& format,
                                  const std::optional<std::string>& player_name,
                                  const std::optional<std::string>& opponent_name) {
    engine_ = std::make_unique<GameStateEngine>();
    ++engine_generation_;
    engine_->subscribe([this](const GameStateSnapshot& snapshot) { publish(snapshot); });

    recorder_ = std::make_unique<MatchTelemetryRecorder>();
    recorder_->start_match(match_id, format, player_name, opponent_name);

    TrackerLog::log("Watcher", format.value_or("Match") + ": " + player_name.value_or("You") +
                    " vs " + opponent_name.value_or("Opponent"));
}

void ArenaLogWatcher::handle_event(const ArenaGameEvent& event) {
    // State before the event, for the narrative
    std::optional<GameStateSnapshot> before;
    if (engine_ && !std::holds_alternative<GameStateUpdateEvent>(event)) {
        before = engine_->state();
    }

    if (auto* e = std::get_if<MatchStartEvent>(&event)) {
        begin_match(e->match_id, e->format, e->player_name, e->opponent_name);
        engine_->process_event(event);
        narrate_match_start(*e);
        before.reset();
    } else if (auto* e = std::get_if<MatchCompleteEvent>(&event)) {
        if (engine_) {
            engine_->process_event(event);
            narrate(event, *before);
            before.reset();
            engine_.reset();
            ++engine_generation_;
        }
        if (recorder_) {
            recorder_->end_match(e->result);
            flush_telemetry(true);
            recorder_.reset();
        }
        TrackerLog::log("Watcher", "Match " + e->match_id + " complete: " + match_result_name(e->result));
    } else if (auto* e = std::get_if<MulliganPromptEvent>(&event)) {
        if (engine_) {
            engine_->process_event(event);
            if (recorder_) recorder_->on_mulligan(e->mulligan_count, e->hand_grp_ids);
        }
    } else if (auto* e = std::get_if<IntermissionEvent>(&event)) {
        if (engine_) {
            engine_->process_event(event);
            if (recorder_) {
                recorder_->on_intermission(e->game_number);
                flush_telemetry(false);
            }
        }
    } else if (auto* e = std::get_if<DeckSubmissionEvent>(&event)) {
        if (engine_) {
            engine_->process_event(event);
            if (recorder_) recorder_->on_deck_submission(e->deck_cards, e->sideboard_cards);
            resolve_decklist(e->deck_cards);
        }
    } else if (auto* e = std::get_if<CardDrawnEvent>(&event)) {
        if (engine_) {
            engine_->process_event(event);
            if (recorder_) recorder_->on_card_drawn(e->grp_id, engine_->state().turn_number, card_name(e->grp_id));
        }
    } else if (auto* e = std::get_if<CardPlayedEvent>(&event)) {
        if (engine_) {
            int turn = engine_->state().turn_number;
            int seat = engine_->state().player_seat_id;
            engine_->process_event(event);
            if (recorder_) recorder_->on_card_played(e->grp_id, e->owner_seat_id, seat, turn, card_name(e->grp_id));
        }
    } else if (auto* e = std::get_if<LifeTotalChangeEvent>(&event)) {
        if (engine_) {
            engine_->process_event(event);
            const auto& state = engine_->state();
            if (recorder_) recorder_->on_life_change(e->seat_id, state.player_seat_id, e->life_total, state.turn_number);
        }
    } else if (auto* e = std::get_if<TurnChangeEvent>(&event)) {
        if (engine_) {
            engine_->process_event(event);
            if (recorder_) {
                recorder_->on_turn_change(e->turn_number, e->active_player, engine_->state().player_seat_id);
                if (recorder_->should_flush()) flush_telemetry(false);
            }
        }
    } else if (auto* e = std::get_if<PhaseChangeEvent>(&event)) {
        if (engine_) {
            engine_->process_event(event);
            if (recorder_) recorder_->on_phase_change(e->phase, e->step, e->turn_number);
        }
    } else if (std::holds_alternative<GameStateUpdateEvent>(event)) {
        // Started mid-game: no match_start was seen
        if (!engine_) {
            std::string match_id = context_.current_match_id.value_or(
                "unknown-" + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now().time_since_epoch()).count()));
            TrackerLog::log("Watcher", "Late join detected, bootstrapping state for " + match_id);
            begin_match(match_id, std::nullopt, context_.player_name, std::nullopt);
        }
        engine_->process_event(event);
        if (resolver_) {
            resolver_->set_name_hints(engine_->object_names());
        }
        fill_names_from_objects();
    } else if (engine_) {
        // zone_change, damage_dealt
        engine_->process_event(event);
    }

    if (engine_ && before) {
        narrate(event, *before);
    }

    if (callbacks_.on_game_event) callbacks_.on_game_event(event);
}

void ArenaLogWatcher::narrate(const ArenaGameEvent& event, const GameStateSnapshot& before) {
    {
        std::lock_guard<std::mutex> lock(game_log_mutex_);
        game_log_.record(event, before, engine_->state(),
                         [this](int grp_id) { return card_name(grp_id); });
    }
    dispatch_game_log();
}

void ArenaLogWatcher::narrate_match_start(const MatchStartEvent& event) {
    {
        std::lock_guard<std::mutex> lock(game_log_mutex_);
        game_log_.begin_match(event);
    }
    dispatch_game_log();
}

// Listener callbacks run outside the lock so they may read the history
void ArenaLogWatcher::dispatch_game_log() {
    std::vector<std::pair<GameLogEntry, bool>> entries;
    entries.swap(unreported_log_);
    for (const auto& [entry, collapsed] : entries) {
        const auto& callback = collapsed ? callbacks_.on_game_log_update : callbacks_.on_game_log;
        if (callback) callback(entry);
    }
}

void ArenaLogWatcher::fill_names_from_objects() {
    const auto& names = engine_->object_names();
    bool any = false;
    for (const auto& entry : engine_->state().deck_list) {
        if (entry.card) continue;
        auto it = names.find(entry.grp_id);
        if (it == names.end() || is_numeric_name(it->second)) continue;

        ResolvedCard card;
        card.grp_id = entry.grp_id;
        card.name = it->second;
        engine_->resolve_card(entry.grp_id, card);
        any = true;
    }
    if (any) {
        publish(engine_->snapshot());
    }
}

void ArenaLogWatcher::flush_telemetry(bool final) {
    if (!recorder_) return;
    TelemetryFlush batch = final ? recorder_->flush_final() : recorder_->flush();
    TrackerLog::debug("Telemetry", "Flush (final=" + std::string(final ? "true" : "false") + "): " +
                      std::to_string(batch.actions.size()) + " actions");
    if (!batch.empty() && callbacks_.on_telemetry_flush) {
        callbacks_.on_telemetry_flush(batch);
    }
}

// ── Card resolution ─────────────────────────────────────────────────────────

void ArenaLogWatcher::resolve_decklist(const std::vector<DeckCard>& cards) {
    if (!resolver_ || !engine_) return;

    std::vector<int> grp_ids;
    for (const auto& card : cards) {
        if (std::find(grp_ids.begin(), grp_ids.end(), card.grp_id) == grp_ids.end()) {
            grp_ids.push_back(card.grp_id);
        }
    }

    auto resolver = resolver_;
    std::uint64_t generation = engine_generation_;

    std::lock_guard<std::mutex> lock(resolutions_mutex_);
    resolutions_.erase(std::remove_if(resolutions_.begin(), resolutions_.end(), [](auto& task) {
        return task.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }), resolutions_.end());

    resolutions_.push_back(std::async(std::launch::async, [this, resolver, grp_ids, generation]() {
        std::map<int, ResolvedCard> resolved;
        try {
            resolved = resolver->resolve_many(grp_ids);
        } catch (const std::exception& e) {
            TrackerLog::warn("Watcher", std::string("Deck resolution failed: ") + e.what());
        }
        // Applied on the poll thread, and only to the engine that asked
        asio::post(io_context_, [this, generation, grp_ids, resolved = std::move(resolved)]() {
            apply_resolved(generation, grp_ids, resolved);
        });
    }));
}

void ArenaLogWatcher::apply_resolved(std::uint64_t generation, const std::vector<int>& grp_ids,
                                     const std::map<int, ResolvedCard>& resolved) {
    if (!running_ || !engine_ || generation != engine_generation_) return;

    const auto& names = engine_->object_names();
    for (int grp_id : grp_ids) {
        auto it = resolved.find(grp_id);
        bool found = it != resolved.end() && !is_numeric_name(it->second.name);
        if (found && !is_placeholder_name(it->second.name)) {
            engine_->resolve_card(grp_id, it->second);
            continue;
        }

        // Digital-only cards are often known only through game object names.
        // The placeholder is kept only when there is none.
        auto name = names.find(grp_id);
        if (name != names.end() && !is_numeric_name(name->second)) {
            ResolvedCard card;
            card.grp_id = grp_id;
            card.name = name->second;
            engine_->resolve_card(grp_id, card);
        } else if (found) {
            engine_->resolve_card(grp_id, it->second);
        }
    }

    publish(engine_->snapshot());
}

std::optional<std::string> ArenaLogWatcher::card_name(int grp_id) const {
    if (engine_) {
        const auto& names = engine_->object_names();
        auto it = names.find(grp_id);
        if (it != names.end()) return it->second;

        const DeckCardEntry* entry = engine_->state().find_deck_card(grp_id);
        if (entry && entry->card && !entry->card->name.empty() && !is_placeholder_name(entry->card->name)) {
            return entry->card->name;
        }
    }
    if (resolver_) {
        auto cached = resolver_->get_cached(grp_id);
        if (cached && !is_placeholder_name(cached->name)) return cached->name;
    }
    return std::nullopt;
}

void ArenaLogWatcher::publish(const GameStateSnapshot& snapshot) {
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        latest_snapshot_ = snapshot;
    }
    if (callbacks_.on_game_state) callbacks_.on_game_state(snapshot);
}

void ArenaLogWatcher::report_error(const std::string& message) {
    TrackerLog::error("Watcher", message);
    if (callbacks_.on_error) callbacks_.on_error(message);
}

} // namespace arena_tracker
