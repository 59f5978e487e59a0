#pragma once
/** @file  InMemoryCatalog.hpp
 *  @brief Full-scan catalog backend (CSV-loadable), exact weighted-L1 ranking.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <string>
#include <vector>

// VibeDJ headers
#include "catalog/CatalogIndex.hpp"
#include "core/FeatureScaler.hpp"
#include "history/WeightStore.hpp"

namespace vibedj::catalog {

  /**
 * @class InMemoryCatalog
 * @brief Scores every track per query; fine for catalogs up to ~100k rows.
 *
 *  * Weight overrides are kept separately and applied to the probability factor of results.
 */
  class InMemoryCatalog : public CatalogIndex {
  public:
    explicit InMemoryCatalog(std::vector<CatalogTrack> tracks = {});

    /**
     * @brief Loads a header-first CSV.
     *
     * Recognized columns: track_id, track_name, artists | artist_name, track_genre | genre,
     * prob_factor and the eight native feature columns. Throws `std::runtime_error`.
     */
    static InMemoryCatalog fromCsv(const std::string& path, const core::FeatureScaler& scaler = core::FeatureScaler{});

    void add(CatalogTrack track);
    void setWeights(history::WeightTable weights) { weights_ = std::move(weights); }
    std::size_t size() const { return tracks_.size(); }
    const std::vector<CatalogTrack>& tracks() const { return tracks_; }

    std::vector<CatalogTrack> nearestMatches(const core::FeatureVector& target, std::size_t n,
                                             const core::MusicFilters* filters = nullptr) override;

    std::string name() const override { return "memory"; }

  private:
    std::vector<CatalogTrack> tracks_;
    history::WeightTable weights_;
  };

} // namespace vibedj::catalog
