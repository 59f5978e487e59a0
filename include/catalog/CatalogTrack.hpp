#pragma once
/** @file  CatalogTrack.hpp
 *  @brief One catalog row in both native and slider units.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <string>

// VibeDJ headers
#include "core/AudioFeatures.hpp"
#include "core/SearchQuery.hpp"

namespace vibedj::catalog {

  struct CatalogTrack {
    std::string id;
    std::string title;  ///< ASCII-safe
    std::string artist; ///< ASCII-safe, first listed artist, "Unknown" when blank
    std::string genre;
    core::FeatureVector native{};
    core::FeatureVector sliders{}; ///< derived from `native`, rounded to 0.1
    double probabilityFactor{ 1.0 };

    std::string searchQuery() const { return core::buildSearchQuery(title, artist); }
  };

} // namespace vibedj::catalog
