#pragma once
/** @file  SqliteCatalog.hpp
 *  @brief SQLite-indexed catalog backend: coarse SQL gate, exact in-process re-rank.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// VibeDJ headers
#include "catalog/CatalogIndex.hpp"
#include "core/FeatureScaler.hpp"
#include "history/WeightStore.hpp"

namespace vibedj::io {
  class SqliteDatabase;
}

namespace vibedj::catalog {

  struct SqliteCatalogSettings {
    std::string table{ "music_tracks_spotify" };
    double energyWindow{ 5.0 };   ///< slider units either side of the target
    double valenceWindow{ 15.0 }; ///< slider units either side of the target
    std::size_t prefilterLimit{ 50000 };
    std::size_t candidateLimitFactor{ 20 };
    std::size_t refineLimit{ 10000 };
  };

  /**
 * @class SqliteCatalog
 * @brief Catalog over `music_tracks_spotify` with weight overrides and genre-size normalization.
 *
 *  1. SQL gate: `prob_factor > 0`, energy/valence windows, filter predicates as LIKE,
 *     ordered by 2|e-te| + 2|v-tv|, limited to max(prefilterLimit, n * candidateLimitFactor).
 *  2. Effective factor = pf * track * artist * genre / max(1, genre track count); rows <= 0 drop.
 *  3. Exact weighted-L1 re-rank, keep max(refineLimit, n), return n.
 *
 *  Store failures are logged and produce an empty result.
 */
  class SqliteCatalog : public CatalogIndex {
  public:
    /// Creates the track and genre-stats tables if needed. Throws `core::StoreError`.
    explicit SqliteCatalog(std::shared_ptr<io::SqliteDatabase> db, SqliteCatalogSettings settings = {},
                           core::FeatureScaler scaler = core::FeatureScaler{});

    //---public API------------------------------------------------------
    std::vector<CatalogTrack> nearestMatches(const core::FeatureVector& target, std::size_t n,
                                             const core::MusicFilters* filters = nullptr) override;

    std::string name() const override { return "sqlite"; }

    /// Bulk insert inside one transaction; native NaN values are stored as NULL.
    void importTracks(const std::vector<CatalogTrack>& tracks);

    /// Recomputes `music_genre_stats` from the track table.
    void rebuildGenreStats();

    std::size_t trackCount();

  private:
    std::unordered_map<std::string, long long> loadGenreCounts();

    std::shared_ptr<io::SqliteDatabase> db_;
    SqliteCatalogSettings settings_;
    core::FeatureScaler scaler_;
    history::WeightStore weights_;
  };

} // namespace vibedj::catalog
