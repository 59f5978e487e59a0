#pragma once
/** @file  CatalogIndex.hpp
 *  @brief Abstract nearest-neighbor contract shared by every catalog backend.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <string>
#include <vector>

// VibeDJ headers
#include "catalog/CatalogTrack.hpp"
#include "core/AudioFeatures.hpp"
#include "core/VibePlan.hpp"

namespace vibedj::catalog {

  /// Weighted-L1 weights in `Feature` order: energy/valence dominate perception.
  inline constexpr core::FeatureVector kDistanceWeights{
    2.0, // energy
    2.0, // valence
    1.0, // loudness
    1.2, // speechiness
    1.2, // acousticness
    1.5, // instrumentalness
    0.7, // liveness
    1.0, // tempo
  };

  /// Weighted L1 distance in slider space.
  double distance(const core::FeatureVector& target, const core::FeatureVector& sliders);

  /**
   * @brief Substring matching on lower-cased ASCII genre, artist and "title by artist".
   *
   * Exclusions are checked first. Inclusions are OR within a category and AND across categories.
   */
  bool passesFilters(const CatalogTrack& track, const core::MusicFilters& filters);

  /**
 * @class CatalogIndex
 * @brief Returns the N tracks closest to a slider target, best first.
 *
 *  * Backends may push \p filters down into their query; callers may re-check them.
 *  * An unavailable backing store yields an empty result, never an exception.
 */
  class CatalogIndex {
  public:
    virtual ~CatalogIndex() = default;

    virtual std::vector<CatalogTrack> nearestMatches(const core::FeatureVector& target, std::size_t n,
                                                     const core::MusicFilters* filters = nullptr) = 0;

    virtual std::string name() const = 0;
  };

} // namespace vibedj::catalog
