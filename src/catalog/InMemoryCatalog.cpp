/* @file InMemoryCatalog.cpp
 * @brief CSV loading and full-scan nearest-neighbor ranking
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>

// third-party headers
#include <spdlog/spdlog.h>

// VibeDJ headers
#include "catalog/InMemoryCatalog.hpp"
#include "core/Logging.hpp"
#include "core/SearchQuery.hpp"

using namespace vibedj::catalog;

namespace {

  /// Splits one RFC-4180 style line; doubled quotes inside a quoted field become one quote.
  std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string cur;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
      const char c = line[i];
      if (quoted) {
        if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
          cur.push_back('"');
          ++i;
        } else if (c == '"') {
          quoted = false;
        } else {
          cur.push_back(c);
        }
      } else if (c == '"') {
        quoted = true;
      } else if (c == ',') {
        fields.push_back(std::move(cur));
        cur.clear();
      } else if (c != '\r') {
        cur.push_back(c);
      }
    }
    fields.push_back(std::move(cur));
    return fields;
  }

  std::optional<double> toDouble(const std::string& s) {
    const auto t = vibedj::core::trim(s);
    if (t.empty())
      return std::nullopt;
    try {
      std::size_t used = 0;
      const double v = std::stod(t, &used);
      if (used != t.size() || !std::isfinite(v))
        return std::nullopt;
      return v;
    } catch (const std::exception&) {
      return std::nullopt;
    }
  }

  struct ScoredRef {
    double dist;
    std::size_t idx;
  };

} // namespace

InMemoryCatalog::InMemoryCatalog(std::vector<CatalogTrack> tracks) : tracks_(std::move(tracks)) {}

void InMemoryCatalog::add(CatalogTrack track) { tracks_.push_back(std::move(track)); }

InMemoryCatalog InMemoryCatalog::fromCsv(const std::string& path, const core::FeatureScaler& scaler) {
  std::ifstream in(path);
  if (!in)
    throw std::runtime_error("[InMemoryCatalog] cannot open catalog csv: " + path);

  std::string line;
  if (!std::getline(in, line))
    throw std::runtime_error("[InMemoryCatalog] empty catalog csv: " + path);

  std::unordered_map<std::string, std::size_t> col;
  const auto header = splitCsvLine(line);
  for (std::size_t i = 0; i < header.size(); ++i)
    col[core::normalizeKey(header[i])] = i;

  const auto column = [&col](std::initializer_list<const char*> names) -> std::optional<std::size_t> {
    for (const char* n : names) {
      if (auto it = col.find(n); it != col.end())
        return it->second;
    }
    return std::nullopt;
  };
  const auto idCol = column({ "track_id" });
  const auto titleCol = column({ "track_name" });
  const auto artistCol = column({ "artists", "artist_name" });
  const auto genreCol = column({ "track_genre", "genre" });
  const auto pfCol = column({ "prob_factor" });
  if (!titleCol)
    throw std::runtime_error("[InMemoryCatalog] csv has no track_name column: " + path);

  std::array<std::optional<std::size_t>, core::kFeatureCount> featureCols{};
  for (auto f : core::kAllFeatures)
    featureCols[core::index(f)] = column({ core::toString(f) });

  std::vector<CatalogTrack> tracks;
  std::size_t skipped = 0;
  while (std::getline(in, line)) {
    if (line.empty())
      continue;
    const auto fields = splitCsvLine(line);
    const auto at = [&fields](const std::optional<std::size_t>& c) -> std::string {
      return (c && *c < fields.size()) ? fields[*c] : std::string{};
    };

    const auto titleRaw = core::trim(at(titleCol));
    if (titleRaw.empty()) {
      ++skipped;
      continue;
    }
    auto artistRaw = core::trim(at(artistCol));
    if (const auto semi = artistRaw.find(';'); semi != std::string::npos)
      artistRaw = core::trim(artistRaw.substr(0, semi));
    if (artistRaw.empty())
      artistRaw = "Unknown";

    CatalogTrack t;
    t.id = core::trim(at(idCol));
    t.title = core::asciiSafe(titleRaw);
    t.artist = core::asciiSafe(artistRaw);
    t.genre = core::asciiSafe(core::trim(at(genreCol)));

    std::array<std::optional<double>, core::kFeatureCount> native{};
    for (std::size_t i = 0; i < core::kFeatureCount; ++i) {
      native[i] = toDouble(at(featureCols[i]));
      t.native[i] = native[i].value_or(std::nan(""));
    }
    t.sliders = scaler.toSliders(native);

    const auto pf = toDouble(at(pfCol));
    t.probabilityFactor = pf ? std::max(0.0, *pf) : 1.0;
    tracks.push_back(std::move(t));
  }

  core::logging::get("catalog")->info("loaded {} tracks from {} (skipped {} without title)", tracks.size(),
                                      path, skipped);
  return InMemoryCatalog(std::move(tracks));
}

std::vector<CatalogTrack> InMemoryCatalog::nearestMatches(const core::FeatureVector& target, std::size_t n,
                                                          const core::MusicFilters* filters) {
  std::vector<ScoredRef> scored;
  scored.reserve(tracks_.size());
  for (std::size_t i = 0; i < tracks_.size(); ++i) {
    if (filters != nullptr && !passesFilters(tracks_[i], *filters))
      continue;
    scored.push_back({ distance(target, tracks_[i].sliders), i });
  }

  const std::size_t keep = std::min(std::max<std::size_t>(1, n), scored.size());
  const auto byDistance = [](const ScoredRef& a, const ScoredRef& b) {
    return a.dist < b.dist || (a.dist == b.dist && a.idx < b.idx);
  };
  std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(keep), scored.end(),
                    byDistance);

  std::vector<CatalogTrack> out;
  out.reserve(keep);
  for (std::size_t i = 0; i < keep; ++i) {
    CatalogTrack t = tracks_[scored[i].idx];
    t.probabilityFactor *= weights_.combined(t.title, t.artist, t.genre);
    out.push_back(std::move(t));
  }
  return out;
}
