/* @file ShortlistSampler.cpp
 * @brief pool filtering and weighted prompt sampling
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_set>

// third-party headers
#include <spdlog/spdlog.h>

// VibeDJ headers
#include "catalog/ShortlistSampler.hpp"
#include "catalog/WeightedSampling.hpp"
#include "core/Logging.hpp"
#include "core/SearchQuery.hpp"
#include "history/HistoryStore.hpp"

using namespace vibedj::catalog;
using vibedj::core::Feature;

std::vector<std::string> vibedj::catalog::defaultBoostGenres() {
  return { "alt-rock", "alternative", "grunge", "hard-rock", "psych-rock", "rock",
           "metal",    "jazz",        "indie",  "singer-songwriter", "songwriter", "acoustic" };
}

ShortlistSampler::ShortlistSampler(std::shared_ptr<CatalogIndex> catalog,
                                   std::shared_ptr<history::HistoryStore> history, SamplerSettings settings)
    : catalog_(std::move(catalog)), history_(std::move(history)), settings_(std::move(settings)) {
  if (!catalog_)
    throw std::invalid_argument("[ShortlistSampler] catalog is nullptr");
}

bool ShortlistSampler::recentlyPlayed(const CatalogTrack& track, core::TimePoint now, RecentCache& cache) const {
  if (!history_)
    return false;
  auto key = core::trackKey(track.title, track.artist);
  if (const auto hit = cache.find(key); hit != cache.end())
    return hit->second;

  const auto st = history_->stats(track.title, track.artist, now);
  bool recent = false;
  if (st.found) {
    recent = (settings_.excludeIfPlayedToday && st.playsToday > 0) ||
             (st.hoursSinceLast && *st.hoursSinceLast < settings_.excludePlayedWithinHours);
  }
  cache.emplace(std::move(key), recent);
  return recent;
}

Shortlist ShortlistSampler::sample(const core::FeatureVector& target, const core::MusicFilters* filters,
                                   std::mt19937& rng, core::TimePoint now) const {
  auto log = core::logging::get("catalog");
  const std::size_t matchPool = std::max<std::size_t>(1, settings_.matchPoolSize);
  const std::size_t basePool =
      std::max(matchPool, settings_.basePoolSize > 0 ? settings_.basePoolSize : matchPool * 5);

  const bool haveFilters = filters != nullptr && !filters->empty();
  const auto base = catalog_->nearestMatches(target, basePool, haveFilters ? filters : nullptr);

  const double te = target[core::index(Feature::Energy)];
  const double tv = target[core::index(Feature::Valence)];

  Shortlist out;
  RecentCache recentCache; // one history lookup per (title, artist) per sample
  std::unordered_set<std::string> seenIds;
  std::size_t rejectedFilters = 0, rejectedRecent = 0, rejectedConstraints = 0, rejectedDupe = 0;

  for (const auto& t : base) {
    if (haveFilters && !passesFilters(t, *filters)) {
      ++rejectedFilters;
      continue;
    }
    if (recentlyPlayed(t, now, recentCache)) {
      ++rejectedRecent;
      continue;
    }
    if (std::fabs(t.sliders[core::index(Feature::Energy)] - te) > settings_.maxEnergyDelta ||
        std::fabs(t.sliders[core::index(Feature::Valence)] - tv) > settings_.maxValenceDelta) {
      ++rejectedConstraints;
      continue;
    }
    if (!t.id.empty() && !seenIds.insert(t.id).second) {
      ++rejectedDupe;
      continue;
    }
    out.pool.push_back(t);
    if (out.pool.size() >= matchPool)
      break;
  }

  log->info("sampling base_pool={} kept={} rejected_music_filters={} rejected_recent={} "
            "rejected_constraints={} rejected_dupe={}",
            base.size(), out.pool.size(), rejectedFilters, rejectedRecent, rejectedConstraints, rejectedDupe);

  if (out.pool.size() <= settings_.promptPickCount) {
    out.sample = out.pool;
    return out;
  }

  std::unordered_set<std::string> boost;
  for (const auto& g : settings_.boostGenres) {
    auto key = core::normalizeKey(core::asciiSafe(g));
    if (!key.empty())
      boost.insert(std::move(key));
  }
  const auto weightFor = [&](const CatalogTrack& t) {
    const double genreW = boost.count(core::normalizeKey(core::asciiSafe(t.genre))) ? settings_.boostFactor : 1.0;
    const double distW = 1.0 / (1.0 + std::max(0.0, distance(target, t.sliders)));
    return std::max(0.0, t.probabilityFactor) * genreW * distW;
  };

  out.sample = weightedSample(out.pool, settings_.promptPickCount, weightFor, rng);
  for (std::size_t i = 0; i < out.sample.size(); ++i) {
    const auto& s = out.sample[i];
    log->debug("provided[{}] '{}' ({}) dist={:.2f} w={:.3f} pf={:.3f}", i + 1, s.searchQuery(), s.genre,
               distance(target, s.sliders), weightFor(s), s.probabilityFactor);
  }
  return out;
}
