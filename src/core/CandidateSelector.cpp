/* @file CandidateSelector.cpp
 * @brief weighted choice over cooldown scores and the backup queue
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <stdexcept>

// third-party headers
#include <spdlog/spdlog.h>

// VibeDJ headers
#include "core/CandidateSelector.hpp"
#include "core/Logging.hpp"
#include "core/SearchQuery.hpp"

using namespace vibedj::core;

CandidateSelector::CandidateSelector(Scorer scorer, std::uint32_t seed) : scorer_(std::move(scorer)), rng_(seed) {
  if (!scorer_)
    throw std::invalid_argument("[CandidateSelector] scorer is empty");
}

std::optional<Selection> CandidateSelector::choose(const std::vector<protocols::Candidate>& candidates) {
  auto log = logging::get("selector");

  std::vector<ScoredCandidate> scored;
  for (const auto& c : candidates) {
    std::string title = trim(c.title);
    std::string artist = trim(c.artist);
    if ((title.empty() || artist.empty()) && !trim(c.searchQuery).empty()) {
      const auto [t2, a2] = parseSearchQuery(c.searchQuery);
      if (title.empty())
        title = t2;
      if (artist.empty())
        artist = a2;
    }
    if (title.empty())
      continue;
    if (artist.empty())
      artist = "Unknown";

    ScoredCandidate s;
    s.title = title;
    s.artist = artist;
    s.searchQuery = buildSearchQuery(title, artist);
    s.reasoning = c.reasoning;
    try {
      s.score = scorer_(title, artist);
    } catch (const std::exception& e) {
      log->warn("scoring '{}' by {} failed, using 1.0: {}", title, artist, e.what());
      s.score = 1.0;
    }
    scored.push_back(std::move(s));
  }
  if (scored.empty())
    return std::nullopt;

  std::vector<double> weights;
  weights.reserve(scored.size());
  double total = 0.0;
  for (const auto& s : scored) {
    const double w = std::isfinite(s.score) ? std::max(0.0, s.score) : 0.0;
    weights.push_back(w);
    total += w;
  }
  for (std::size_t i = 0; i < scored.size(); ++i)
    scored[i].probability = total > 0.0 ? weights[i] / total * 100.0 : 100.0 / static_cast<double>(scored.size());

  for (std::size_t i = 0; i < scored.size(); ++i) {
    log->info("candidate [{}] {:<35.35} by {:<20.20} | score={:.3f} | prob={:5.1f}%", i + 1, scored[i].title,
              scored[i].artist, scored[i].score, scored[i].probability);
  }

  std::size_t pick = 0;
  if (total > 0.0) {
    std::discrete_distribution<std::size_t> dist(weights.begin(), weights.end());
    pick = dist(rng_);
  } else { // every score zero: uniform
    std::uniform_int_distribution<std::size_t> dist(0, scored.size() - 1);
    pick = dist(rng_);
  }

  Selection out;
  out.chosen = scored[pick];
  scored.erase(scored.begin() + static_cast<std::ptrdiff_t>(pick));
  std::stable_sort(scored.begin(), scored.end(),
                   [](const ScoredCandidate& a, const ScoredCandidate& b) { return a.score > b.score; });
  backups_ = std::move(scored);
  out.backupCount = backups_.size();

  log->info("selected '{}' by {} (prob was {:.1f}%)", out.chosen.title, out.chosen.artist, out.chosen.probability);
  return out;
}

std::optional<ScoredCandidate> CandidateSelector::popBackup() {
  if (backups_.empty())
    return std::nullopt;
  ScoredCandidate front = std::move(backups_.front());
  backups_.erase(backups_.begin());
  return front;
}
