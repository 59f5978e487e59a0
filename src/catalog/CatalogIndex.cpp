/* @file CatalogIndex.cpp
 * @brief distance metric and music-filter predicate shared by all backends
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>

// VibeDJ headers
#include "catalog/CatalogIndex.hpp"
#include "core/SearchQuery.hpp"

namespace vibedj::catalog {

  namespace {

    std::string norm(const std::string& s) { return core::normalizeKey(core::asciiSafe(s)); }

    std::vector<std::string> normAll(const std::vector<std::string>& in) {
      std::vector<std::string> out;
      for (const auto& s : in) {
        auto n = norm(s);
        if (!n.empty())
          out.push_back(std::move(n));
      }
      return out;
    }

    bool containsAny(const std::string& haystack, const std::vector<std::string>& needles) {
      return std::any_of(needles.begin(), needles.end(),
                         [&](const std::string& n) { return haystack.find(n) != std::string::npos; });
    }

  } // namespace

  double distance(const core::FeatureVector& target, const core::FeatureVector& sliders) {
    double d = 0.0;
    for (std::size_t i = 0; i < core::kFeatureCount; ++i)
      d += kDistanceWeights[i] * std::abs(target[i] - sliders[i]);
    return d;
  }

  bool passesFilters(const CatalogTrack& track, const core::MusicFilters& filters) {
    if (filters.empty())
      return true;

    const auto genre = norm(track.genre);
    const auto artist = norm(track.artist);
    const auto query = norm(track.searchQuery());

    if (containsAny(genre, normAll(filters.excludeGenres)))
      return false;
    if (containsAny(artist, normAll(filters.excludeArtists)))
      return false;

    const auto incGenres = normAll(filters.includeGenres);
    if (!incGenres.empty() && !containsAny(genre, incGenres))
      return false;
    const auto incArtists = normAll(filters.includeArtists);
    if (!incArtists.empty() && !containsAny(artist, incArtists))
      return false;
    const auto incKeywords = normAll(filters.includeKeywords);
    if (!incKeywords.empty() && !containsAny(query, incKeywords))
      return false;

    return true;
  }

} // namespace vibedj::catalog
