#pragma once
/** @file  HistoryStore.hpp
 *  @brief Persistent play history (`played_songs`) with rolling period counters.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// VibeDJ headers
#include "core/AudioFeatures.hpp"
#include "core/TimeUtil.hpp"

namespace vibedj::io {
  class SqliteDatabase;
}

namespace vibedj::history {

  struct HistoryRecord {
    std::int64_t id{ 0 };
    std::string title;
    std::string artist;
    std::string searchQuery;
    core::TimePoint firstPlayed{};
    core::TimePoint lastPlayed{};
    int playsToday{ 0 };
    int playsWeek{ 0 };
    int playsMonth{ 0 };
    int playsYear{ 0 };
    int playsAllTime{ 0 };
    std::string lastResetDate; ///< YYYY-MM-DD (UTC), empty when never reset
    core::SliderSnapshot lastTargets{};
  };

  struct PlayStats {
    bool found{ false };
    int playsToday{ 0 };
    int playsWeek{ 0 };
    int playsAllTime{ 0 };
    std::optional<double> hoursSinceLast; ///< nullopt when never played
  };

  /**
 * @class HistoryStore
 * @brief One row per normalized (title, artist); upserted on every pick.
 *
 *  * Matching is trim + lowercase on both fields; the original casing of the first play is kept.
 *  * Touched only from the coordinator thread.
 *  * Methods are virtual so selector/sampler tests can substitute a mock.
 */
  class HistoryStore {
  public:
    /// Creates the schema if needed. Throws `core::StoreError`.
    explicit HistoryStore(std::shared_ptr<io::SqliteDatabase> db);
    virtual ~HistoryStore() = default;

    //---public API------------------------------------------------------
    /// Upsert: reset counters crossing a period boundary, then increment every counter.
    virtual HistoryRecord recordPlay(const std::string& title, const std::string& artist,
                                     const std::optional<std::string>& searchQuery,
                                     const std::optional<core::AudioTargets>& targets,
                                     core::TimePoint now);

    /// Counters as they would read at \p now (period resets applied, not persisted).
    virtual PlayStats stats(const std::string& title, const std::string& artist, core::TimePoint now);

    /// Hours since any track by \p artist was last played; nullopt when never (or blank artist).
    virtual std::optional<double> artistHoursSinceLast(const std::string& artist, core::TimePoint now);

    /// Most recent \p limit plays, returned oldest first.
    virtual std::vector<HistoryRecord> recentlyPlayed(std::size_t limit);

    virtual std::optional<HistoryRecord> lastPlayed();

    virtual std::optional<HistoryRecord> find(const std::string& title, const std::string& artist);

    /**
     * @brief Zero the counters whose period changed since `lastResetDate`.
     *
     *  * day:   date string differs
     *  * week:  ISO week number or calendar year differs
     *  * month: month or year differs
     *  * year:  year differs
     *  An empty (or unparsable) reset date is stamped with today and nothing is reset.
     */
    static void applyPeriodReset(HistoryRecord& record, core::TimePoint now);

  protected:
    HistoryStore() = default; ///< for mocks that never touch the database

  private:
    void initSchema();

    std::shared_ptr<io::SqliteDatabase> db_;
  };

} // namespace vibedj::history
