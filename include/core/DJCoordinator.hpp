#pragma once
/** @file  DJCoordinator.hpp
 *  @brief Single-consumer state machine that owns picking, queueing and backups.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// third-party headers
#include <nlohmann/json.hpp>

// VibeDJ headers
#include "core/DJEvent.hpp"
#include "core/EventQueue.hpp"
#include "core/PlaybackClient.hpp"
#include "core/TimeUtil.hpp"
#include "protocols/RecommenderOracle.hpp"

namespace vibedj::catalog {
  class ShortlistSampler;
}
namespace vibedj::history {
  class HistoryStore;
}
namespace vibedj::protocols {
  class ContextSource;
}

namespace vibedj::core {

  class CandidateSelector;
  class ErrorMonitor;
  class PickJournal;
  class VibePlanner;

  struct CoordinatorSettings {
    std::chrono::seconds pickDebounce{ 5 };
    std::chrono::seconds queueRetryCooldown{ 20 };
    std::chrono::seconds syncPickTimeout{ 90 };
    std::chrono::milliseconds queueWait{ 250 };
    std::chrono::milliseconds chatPollInterval{ 2500 };
    std::chrono::hours chatLookback{ 6 };
    std::chrono::milliseconds chatTriggerDebounce{ 2000 };
    std::size_t chatPollLimit{ 20 };
    std::chrono::hours planningChatWindow{ 3 };
    std::size_t planningChatLimit{ 50 };
    std::size_t recentlyPlayedWindow{ 10 };
    std::size_t maxFromShortlist{ 5 };
    std::size_t totalCandidates{ 10 };
  };

  /// Collaborators; every member except `journal` is required.
  struct CoordinatorDeps {
    std::shared_ptr<VibePlanner> planner;
    std::shared_ptr<protocols::RecommenderOracle> recommender;
    std::shared_ptr<catalog::ShortlistSampler> sampler;
    std::shared_ptr<history::HistoryStore> history;
    std::shared_ptr<CandidateSelector> selector;
    std::shared_ptr<PlaybackClient> playback;
    std::shared_ptr<protocols::ContextSource> context;
    std::shared_ptr<ErrorMonitor> errorMonitor;
    std::shared_ptr<PickJournal> journal;
  };

  /**
 * @class DJCoordinator
 * @brief Every mutation is an event handled in order on one consumer thread.
 *
 *  * Picks, history writes and catalog queries run only on the consumer thread, so at most one
 *    pick is in progress at any time without further locking.
 *  * Public methods are safe from any thread: they enqueue, or block on a single-slot reply
 *    with a timeout (timeout yields nullopt, never an exception).
 *  * Playback passthroughs go straight to the PlaybackClient, which serializes writes.
 *  * `status()` is approximate: flags are read live, the rest is the snapshot published after
 *    the last handled event. `statusStrict()` round-trips through the queue.
 */
  class DJCoordinator {
  public:
    explicit DJCoordinator(CoordinatorDeps deps, CoordinatorSettings settings = {},
                           ClockFn clock = systemNow);
    ~DJCoordinator(); ///< stop() + join

    DJCoordinator(const DJCoordinator&) = delete;
    DJCoordinator& operator=(const DJCoordinator&) = delete;

    //---lifecycle-------------------------------------------------------
    void start();
    /// Enqueues Stop and waits up to \p joinTimeout; false when the loop did not exit in time.
    bool stop(std::chrono::milliseconds joinTimeout = std::chrono::seconds(2));
    bool running() const { return running_; }

    //---control---------------------------------------------------------
    void enable(bool continuous = true); ///< starts the loop if needed
    void disable();
    void setContinuousMode(bool enabled);
    void onTrackChanged(std::optional<protocols::TrackInfo> track);
    void requestPickAndQueue(std::string reason = "manual");
    void onFrontendQueued(nlohmann::json data);

    /// nullopt immediately when disabled, on timeout, or when no pick could be made.
    std::optional<PickResult> pickSong(std::string reason = "manual");
    std::optional<PickResult> pickSong(std::string reason, std::chrono::milliseconds timeout);

    /// Bypasses the enabled check and starts the loop if needed; does not toggle any state.
    std::optional<PickResult> pickSongOnce(std::string reason = "manual_once");
    std::optional<PickResult> pickSongOnce(std::string reason, std::chrono::milliseconds timeout);

    /// Pops the best remaining backup and records it to history.
    std::optional<BackupSong> getBackupSong(std::chrono::milliseconds timeout = std::chrono::seconds(5));

    //---status----------------------------------------------------------
    CoordinatorStatus status() const;
    std::optional<CoordinatorStatus> statusStrict(std::chrono::milliseconds timeout = std::chrono::seconds(5));
    bool enabled() const { return enabled_; }
    bool continuousMode() const { return continuous_; }
    bool pickInProgress() const { return pickInProgress_; }

    //---playback passthroughs------------------------------------------
    bool play();
    bool pause();
    bool next();
    bool previous();
    bool searchAndPlay(const std::string& query);
    bool setVolume(double volume);
    bool queueNext(const std::string& query);
    /// Empty (after trim) query returns false.
    bool playSong(const std::string& query, PlayMode mode = PlayMode::QueueNext);

    /**
     * @brief Splits oracle candidates into shortlist-sourced and novel ones.
     *
     * Matching is exact on trimmed (title, artist). Up to min(\p maxFromShortlist, shortlist size)
     * shortlist entries are kept, backfilled from the shortlist itself (skipping entries already
     * used) when the oracle under-delivers; novel ones are truncated to \p total minus that.
     * An empty shortlist leaves \p candidates untouched.
     */
    static std::vector<protocols::Candidate>
    enforceShortlistContract(const std::vector<protocols::Candidate>& candidates,
                             const std::vector<protocols::ProvidedSong>& shortlist, std::size_t maxFromShortlist = 5,
                             std::size_t total = 10);

  private:
    void loop();
    void pollMusicChat();
    void handle(DJEvent& event);
    void onTrackChangedImpl(const std::optional<protocols::TrackInfo>& track);
    void pickAndQueue(const std::string& reason);
    std::optional<PickResult> doPick(bool debounce, bool allowWhenDisabled);
    std::optional<BackupSong> takeBackup();
    void recordPick(const std::string& title, const std::string& artist, const std::string& searchQuery,
                    const AudioTargets& targets);
    void journal(const std::string& source, const std::string& title, const std::string& artist,
                 const std::string& searchQuery, const std::string& reasoning, double score,
                 const VibeTargets& targets);
    void scheduleRetry(const std::string& why);
    CoordinatorStatus buildStatus() const;
    void publishSnapshot();

    CoordinatorDeps deps_;
    CoordinatorSettings settings_;
    ClockFn clock_;

    BlockingQueue<DJEvent> queue_;
    std::thread thread_;
    std::mutex lifecycleMtx_;
    std::future<void> loopDone_;
    std::atomic<bool> running_{ false };
    std::atomic<bool> loopAlive_{ false };

    // Written only by the consumer thread.
    std::atomic<bool> enabled_{ false };
    std::atomic<bool> continuous_{ false };
    std::atomic<bool> nextSongQueued_{ false };
    std::atomic<bool> pickInProgress_{ false };
    std::optional<TimePoint> lastPick_;
    std::optional<TimePoint> retryAfter_;
    std::optional<std::string> currentTrackId_;
    std::optional<TimePoint> lastSeenChat_;
    std::optional<TimePoint> lastChatTrigger_;
    std::chrono::steady_clock::time_point lastChatPoll_{};
    std::string lastAction_;
    std::optional<TimePoint> lastActionTime_;

    mutable std::mutex snapshotMtx_;
    CoordinatorStatus snapshot_; ///< published by the consumer thread
  };

} // namespace vibedj::core
