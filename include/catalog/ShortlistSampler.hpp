#pragma once
/** @file  ShortlistSampler.hpp
 *  @brief Builds the filtered match pool and the weighted prompt shortlist for the recommender.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <memory>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

// VibeDJ headers
#include "catalog/CatalogIndex.hpp"
#include "core/TimeUtil.hpp"

namespace vibedj::history {
  class HistoryStore;
}

namespace vibedj::catalog {

  /// Genres whose sampling weight is multiplied by `boostFactor`.
  std::vector<std::string> defaultBoostGenres();

  struct SamplerSettings {
    std::size_t matchPoolSize{ 100 };
    std::size_t basePoolSize{ 0 }; ///< 0 means 5 * matchPoolSize
    std::size_t promptPickCount{ 10 };
    double excludePlayedWithinHours{ 24.0 };
    bool excludeIfPlayedToday{ true };
    std::vector<std::string> boostGenres{ defaultBoostGenres() };
    double boostFactor{ 4.0 };
    double maxEnergyDelta{ 5.0 };
    double maxValenceDelta{ 10.0 };
  };

  struct Shortlist {
    std::vector<CatalogTrack> pool;   ///< filtered nearest matches, at most matchPoolSize
    std::vector<CatalogTrack> sample; ///< offered to the recommender, at most promptPickCount
  };

  /**
 * @class ShortlistSampler
 * @brief Nearest matches -> filters -> weighted sample.
 *
 *  Pool filters run in order: music filters, recently played, hard energy/valence deltas,
 *  duplicate track id. The pool never falls back to looser constraints; a small pool is returned
 *  as is and becomes the sample when it holds no more than `promptPickCount` tracks.
 *  Sample weight = probabilityFactor * (boostFactor if genre boosted) / (1 + distance).
 */
  class ShortlistSampler {
  public:
    /// \p history may be null, in which case nothing counts as recently played.
    ShortlistSampler(std::shared_ptr<CatalogIndex> catalog, std::shared_ptr<history::HistoryStore> history,
                     SamplerSettings settings = {});

    Shortlist sample(const core::FeatureVector& target, const core::MusicFilters* filters, std::mt19937& rng,
                     core::TimePoint now) const;

    const SamplerSettings& settings() const { return settings_; }

  private:
    using RecentCache = std::unordered_map<std::string, bool>; ///< trackKey -> recently played

    bool recentlyPlayed(const CatalogTrack& track, core::TimePoint now, RecentCache& cache) const;

    std::shared_ptr<CatalogIndex> catalog_;
    std::shared_ptr<history::HistoryStore> history_;
    SamplerSettings settings_;
  };

} // namespace vibedj::catalog
