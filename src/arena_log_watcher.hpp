#pragma once

#include "block_extractor.hpp"
#include "event_extractor.hpp"
#include "game_log.hpp"
#include "game_state_engine.hpp"
#include "grp_id_resolver.hpp"
#include "log_tailer.hpp"
#include "match_history.hpp"
#include "telemetry_recorder.hpp"
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace arena_tracker {

struct WatcherOptions {
    std::string log_path;
    std::chrono::milliseconds poll_interval{500};
    bool catch_up = false;
    std::uint64_t catch_up_window = LogTailer::kDefaultCatchUpWindow;
};

// All callbacks run on the watcher's poll thread
struct WatcherCallbacks {
    std::function<void(const ArenaMatch&)> on_match;
    std::function<void(const CardCollection&)> on_collection;
    std::function<void(const GameStateSnapshot&)> on_game_state;
    std::function<void(const ArenaGameEvent&)> on_game_event;
    std::function<void(const TelemetryFlush&)> on_telemetry_flush;
    std::function<void(const GameLogEntry&)> on_game_log;
    // An entry already reported gained another repeat
    std::function<void(const GameLogEntry&)> on_game_log_update;
    std::function<void(const std::string&)> on_error;
};

// Tails Player.log and drives both the legacy match parser and the live
// event pipeline. One poll cycle runs at a time on a private io_context.
class ArenaLogWatcher {
public:
    ArenaLogWatcher(WatcherOptions options, WatcherCallbacks callbacks);
    ~ArenaLogWatcher();

    ArenaLogWatcher(const ArenaLogWatcher&) = delete;
    ArenaLogWatcher& operator=(const ArenaLogWatcher&) = delete;

    void set_resolver(std::shared_ptr<GrpIdResolver> resolver) { resolver_ = std::move(resolver); }

    // background=true polls on an internal thread; false leaves polling to poll_once()
    void start(bool background = true);
    void stop();

    // Runs one poll cycle on the calling thread. Only valid without a background thread.
    PollStatus poll_once();

    // Blocks until outstanding card resolutions finish, then applies them
    // (foreground mode) or lets the poll thread apply them.
    void wait_for_resolutions();

    bool is_running() const { return running_; }
    int match_count() const { return match_count_; }

    // Current match state, or the final state of the last match
    std::optional<GameStateSnapshot> game_state() const;

    // Narrative of the current match, or of the last one once it ended
    std::vector<GameLogEntry> log_history() const;
    std::optional<LastMatchInfo> last_match_info() const;

    // Decode statistics; only meaningful from the poll thread or when stopped
    const ExtractionContext& context() const { return context_; }

private:
    void schedule_poll();
    PollStatus poll_tailer();
    void run_posted();

    void on_chunk(const std::string& chunk);
    void on_reset(ResetReason reason);
    void process_legacy(const std::vector<JsonBlock>& blocks);
    void process_streaming(const std::vector<JsonBlock>& blocks);
    void handle_event(const ArenaGameEvent& event);
    void narrate(const ArenaGameEvent& event, const GameStateSnapshot& before);
    void narrate_match_start(const MatchStartEvent& event);
    void dispatch_game_log();

    void begin_match(const std::string& match_id, const std::optional<std::string>& format,
                     const std::optional<std::string>& player_name,
                     const std::optional<std::string>& opponent_name);
    void fill_names_from_objects();
    void flush_telemetry(bool final);
    void resolve_decklist(const std::vector<DeckCard>& cards);
    void apply_resolved(std::uint64_t generation, const std::vector<int>& grp_ids,
                        const std::map<int, ResolvedCard>& resolved);
    std::optional<std::string> card_name(int grp_id) const;
    void publish(const GameStateSnapshot& snapshot);
    void report_error(const std::string& message);

    WatcherOptions options_;
    WatcherCallbacks callbacks_;
    std::shared_ptr<GrpIdResolver> resolver_;

    asio::io_context io_context_;
    asio::steady_timer timer_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    bool background_ = false;

    LogTailer tailer_;

    // Legacy path
    MatchHistoryParser history_;
    std::set<std::string> seen_match_ids_;
    std::atomic<int> match_count_{0};

    // Streaming path
    StreamingBlockExtractor extractor_;
    ExtractionContext context_;
    std::unique_ptr<GameStateEngine> engine_;
    std::unique_ptr<MatchTelemetryRecorder> recorder_;
    std::uint64_t engine_generation_ = 0;

    mutable std::mutex game_log_mutex_;
    GameLog game_log_;
    std::vector<std::pair<GameLogEntry, bool>> unreported_log_;

    std::mutex resolutions_mutex_;
    std::vector<std::future<void>> resolutions_;

    mutable std::mutex snapshot_mutex_;
    std::optional<GameStateSnapshot> latest_snapshot_;
};

} // namespace arena_tracker
