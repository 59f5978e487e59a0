/* @file SqliteCatalog.cpp
 * @brief gated SQL prefilter over music_tracks_spotify plus exact re-rank
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <utility>

// third-party headers
#include <spdlog/spdlog.h>

// VibeDJ headers
#include "catalog/SqliteCatalog.hpp"
#include "core/Errors.hpp"
#include "core/Logging.hpp"
#include "core/SearchQuery.hpp"
#include "io/SqliteDatabase.hpp"

using namespace vibedj::catalog;
using vibedj::core::Feature;

namespace {

  // Native feature columns in `Feature` order.
  constexpr const char* kFeatureColumns =
      "energy, valence, loudness, speechiness, acousticness, instrumentalness, liveness, tempo";

  bool isIdentifier(const std::string& s) {
    if (s.empty())
      return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isalnum(c) || c == '_'; });
  }

  std::string schemaFor(const std::string& table) {
    return "CREATE TABLE IF NOT EXISTS " + table +
           " ("
           "id INTEGER PRIMARY KEY AUTOINCREMENT, "
           "track_id TEXT, "
           "track_name TEXT NOT NULL, "
           "artist_name TEXT NOT NULL, "
           "genre TEXT, "
           "prob_factor REAL NOT NULL DEFAULT 1.0, "
           "energy REAL, valence REAL, loudness REAL, speechiness REAL, acousticness REAL, "
           "instrumentalness REAL, liveness REAL, tempo REAL); "
           "CREATE INDEX IF NOT EXISTS idx_" + table + "_energy_valence ON " + table + " (energy, valence); "
           "CREATE INDEX IF NOT EXISTS idx_" + table + "_genre_energy_valence ON " + table +
           " (genre, energy, valence); "
           "CREATE TABLE IF NOT EXISTS music_genre_stats ("
           "genre TEXT PRIMARY KEY, track_count INTEGER NOT NULL DEFAULT 0);";
  }

  std::vector<std::string> normalizedTerms(const std::vector<std::string>& in) {
    std::vector<std::string> out;
    for (const auto& x : in) {
      auto n = vibedj::core::normalizeKey(vibedj::core::asciiSafe(x));
      if (!n.empty())
        out.push_back(std::move(n));
    }
    return out;
  }

  std::string orJoin(const std::string& predicate, std::size_t count) {
    std::string out = "(";
    for (std::size_t i = 0; i < count; ++i) {
      if (i > 0)
        out += " OR ";
      out += predicate;
    }
    return out + ")";
  }

  /// WHERE fragments and their LIKE parameters, in bind order.
  struct FilterSql {
    std::string where;
    std::vector<std::string> params;
  };

  FilterSql buildFilterSql(const vibedj::core::MusicFilters& f) {
    FilterSql out;
    const auto like = [](const std::string& s) { return "%" + s + "%"; };

    for (const auto& g : normalizedTerms(f.excludeGenres)) {
      out.where += " AND LOWER(genre) NOT LIKE ?";
      out.params.push_back(like(g));
    }
    for (const auto& a : normalizedTerms(f.excludeArtists)) {
      out.where += " AND LOWER(artist_name) NOT LIKE ?";
      out.params.push_back(like(a));
    }

    const auto genres = normalizedTerms(f.includeGenres);
    if (!genres.empty()) {
      out.where += " AND " + orJoin("LOWER(genre) LIKE ?", genres.size());
      for (const auto& g : genres)
        out.params.push_back(like(g));
    }
    const auto artists = normalizedTerms(f.includeArtists);
    if (!artists.empty()) {
      out.where += " AND " + orJoin("LOWER(artist_name) LIKE ?", artists.size());
      for (const auto& a : artists)
        out.params.push_back(like(a));
    }
    const auto keywords = normalizedTerms(f.includeKeywords);
    if (!keywords.empty()) {
      out.where += " AND (" + orJoin("LOWER(track_name) LIKE ?", keywords.size()) + " OR " +
                   orJoin("LOWER(artist_name) LIKE ?", keywords.size()) + ")";
      for (int pass = 0; pass < 2; ++pass) {
        for (const auto& k : keywords)
          out.params.push_back(like(k));
      }
    }
    return out;
  }

  double windowBound(double target, double delta) { return std::clamp((target + delta) / 100.0, 0.0, 1.0); }

  double lookup(const std::unordered_map<std::string, double>& m, const std::string& key) {
    const auto it = m.find(key);
    return it == m.end() ? 1.0 : std::max(0.0, it->second);
  }

} // namespace

SqliteCatalog::SqliteCatalog(std::shared_ptr<io::SqliteDatabase> db, SqliteCatalogSettings settings,
                             core::FeatureScaler scaler)
    : db_(std::move(db)), settings_(std::move(settings)), scaler_(scaler), weights_(db_) {
  if (!isIdentifier(settings_.table))
    throw std::invalid_argument("[SqliteCatalog] invalid table name: " + settings_.table);
  db_->exec(schemaFor(settings_.table));
}

std::unordered_map<std::string, long long> SqliteCatalog::loadGenreCounts() {
  std::unordered_map<std::string, long long> out;
  auto stmt = db_->prepare("SELECT genre, track_count FROM music_genre_stats");
  while (stmt.step())
    out[core::normalizeKey(stmt.columnText(0))] = stmt.columnInt64(1);
  return out;
}

std::vector<CatalogTrack> SqliteCatalog::nearestMatches(const core::FeatureVector& target, std::size_t n,
                                                        const core::MusicFilters* filters) {
  auto log = core::logging::get("catalog");
  const std::size_t wanted = std::max<std::size_t>(1, n);
  const std::size_t prefilter = std::max(settings_.prefilterLimit, wanted * settings_.candidateLimitFactor);
  const std::size_t refine = std::max(settings_.refineLimit, wanted);

  const double te = target[core::index(Feature::Energy)];
  const double tv = target[core::index(Feature::Valence)];
  const double ew = std::max(0.0, settings_.energyWindow);
  const double vw = std::max(0.0, settings_.valenceWindow);

  FilterSql filterSql;
  if (filters != nullptr)
    filterSql = buildFilterSql(*filters);

  const std::string sql = std::string("SELECT track_id, track_name, artist_name, genre, prob_factor, ") +
                          kFeatureColumns + " FROM " + settings_.table +
                          " WHERE prob_factor > 0 AND energy BETWEEN ? AND ? AND valence BETWEEN ? AND ?" +
                          filterSql.where +
                          " ORDER BY (2.0 * ABS(COALESCE(energy, 0.5) * 100.0 - ?)"
                          " + 2.0 * ABS(COALESCE(valence, 0.5) * 100.0 - ?)) ASC LIMIT ?";

  std::vector<std::pair<double, CatalogTrack>> ranked;
  const auto t0 = std::chrono::steady_clock::now();
  try {
    const auto weights = weights_.loadAll();
    const auto genreCounts = loadGenreCounts();

    auto stmt = db_->prepare(sql);
    int p = 1;
    stmt.bindDouble(p++, windowBound(te, -ew)).bindDouble(p++, windowBound(te, ew));
    stmt.bindDouble(p++, windowBound(tv, -vw)).bindDouble(p++, windowBound(tv, vw));
    for (const auto& param : filterSql.params)
      stmt.bindText(p++, param);
    stmt.bindDouble(p++, te).bindDouble(p++, tv);
    stmt.bindInt64(p++, static_cast<std::int64_t>(prefilter));

    std::size_t fetched = 0;
    while (stmt.step()) {
      ++fetched;
      const auto titleRaw = core::trim(stmt.columnText(1));
      if (titleRaw.empty())
        continue;
      auto artistRaw = core::trim(stmt.columnText(2));
      if (artistRaw.empty())
        artistRaw = "Unknown";
      const auto genreRaw = core::trim(stmt.columnText(3));

      const auto pf = stmt.columnOptionalDouble(4);
      const double base = pf ? std::max(0.0, *pf) : 1.0;
      const auto countIt = genreCounts.find(core::normalizeKey(genreRaw));
      const double denom = static_cast<double>(std::max<long long>(1, countIt == genreCounts.end() ? 0 : countIt->second));
      const double effective = base * lookup(weights.track, core::trackKey(titleRaw, artistRaw)) *
                               lookup(weights.artist, core::normalizeKey(artistRaw)) *
                               lookup(weights.genre, core::normalizeKey(genreRaw)) / denom;
      if (!(effective > 0.0))
        continue;

      CatalogTrack t;
      t.id = core::trim(stmt.columnText(0));
      t.title = core::asciiSafe(titleRaw);
      t.artist = core::asciiSafe(artistRaw);
      t.genre = core::asciiSafe(genreRaw);
      std::array<std::optional<double>, core::kFeatureCount> native{};
      for (std::size_t i = 0; i < core::kFeatureCount; ++i) {
        native[i] = stmt.columnOptionalDouble(5 + static_cast<int>(i));
        t.native[i] = native[i].value_or(std::nan(""));
      }
      t.sliders = scaler_.toSliders(native);
      t.probabilityFactor = effective;

      const double d = distance(target, t.sliders);
      ranked.emplace_back(d, std::move(t));
    }

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
    log->info("fetched {} gated rows in {}ms (prefilter_limit={}) energy=[{:.1f}+-{:.1f}] valence=[{:.1f}+-{:.1f}]",
              fetched, ms.count(), prefilter, te, ew, tv, vw);
  } catch (const core::StoreError& e) {
    log->warn("catalog query failed, returning no matches: {}", e.what());
    return {};
  }

  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const auto& a, const auto& b) { return a.first < b.first; });
  if (ranked.size() > refine)
    ranked.resize(refine);

  std::vector<CatalogTrack> out;
  const std::size_t keep = std::min(wanted, ranked.size());
  out.reserve(keep);
  for (std::size_t i = 0; i < keep; ++i)
    out.push_back(std::move(ranked[i].second));
  return out;
}

void SqliteCatalog::importTracks(const std::vector<CatalogTrack>& tracks) {
  db_->exec("BEGIN");
  try {
    auto stmt = db_->prepare("INSERT INTO " + settings_.table +
                             " (track_id, track_name, artist_name, genre, prob_factor, " + kFeatureColumns +
                             ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    for (const auto& t : tracks) {
      stmt.reset();
      stmt.bindText(1, t.id).bindText(2, t.title).bindText(3, t.artist).bindText(4, t.genre);
      stmt.bindDouble(5, t.probabilityFactor);
      for (std::size_t i = 0; i < core::kFeatureCount; ++i) {
        const int idx = 6 + static_cast<int>(i);
        if (std::isfinite(t.native[i]))
          stmt.bindDouble(idx, t.native[i]);
        else
          stmt.bindNull(idx);
      }
      stmt.step();
    }
    db_->exec("COMMIT");
  } catch (const core::StoreError&) {
    db_->exec("ROLLBACK");
    throw;
  }
  core::logging::get("catalog")->info("imported {} tracks into {}", tracks.size(), settings_.table);
}

void SqliteCatalog::rebuildGenreStats() {
  db_->exec("DELETE FROM music_genre_stats; INSERT INTO music_genre_stats (genre, track_count) "
            "SELECT LOWER(TRIM(COALESCE(genre, ''))), COUNT(*) FROM " +
            settings_.table + " GROUP BY LOWER(TRIM(COALESCE(genre, '')))");
}

std::size_t SqliteCatalog::trackCount() {
  auto stmt = db_->prepare("SELECT COUNT(*) FROM " + settings_.table);
  stmt.step();
  return static_cast<std::size_t>(stmt.columnInt64(0));
}
