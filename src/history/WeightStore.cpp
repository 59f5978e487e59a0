/* @file WeightStore.cpp
 * @brief per-scope weight override tables
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>

// third-party headers
#include <spdlog/spdlog.h>

// VibeDJ headers
#include "core/Logging.hpp"
#include "core/SearchQuery.hpp"
#include "history/WeightStore.hpp"
#include "io/SqliteDatabase.hpp"

using namespace vibedj::history;

namespace {

  constexpr const char* kSchema = R"sql(
    CREATE TABLE IF NOT EXISTS music_genre_weights (
      genre TEXT PRIMARY KEY,
      factor REAL NOT NULL DEFAULT 1.0
    );
    CREATE TABLE IF NOT EXISTS music_artist_weights (
      artist TEXT PRIMARY KEY,
      factor REAL NOT NULL DEFAULT 1.0
    );
    CREATE TABLE IF NOT EXISTS music_track_weights (
      track_key TEXT PRIMARY KEY,
      title TEXT,
      artist TEXT,
      factor REAL NOT NULL DEFAULT 1.0
    );
  )sql";

  struct ScopeTable {
    const char* table;
    const char* keyColumn;
  };

  ScopeTable tableFor(WeightScope s) {
    switch (s) {
    case WeightScope::Genre:
      return { "music_genre_weights", "genre" };
    case WeightScope::Artist:
      return { "music_artist_weights", "artist" };
    case WeightScope::Track:
      return { "music_track_weights", "track_key" };
    }
    throw std::invalid_argument("[WeightStore] unknown scope");
  }

  std::string keyFor(WeightScope s, const std::string& name, const std::string& artist) {
    if (s == WeightScope::Track) {
      if (vibedj::core::trim(name).empty() || vibedj::core::trim(artist).empty())
        throw std::invalid_argument("[WeightStore] track scope needs title and artist");
      return vibedj::core::trackKey(name, artist);
    }
    const auto key = vibedj::core::normalizeKey(name);
    if (key.empty())
      throw std::invalid_argument(std::string("[WeightStore] empty ") + toString(s) + " key");
    return key;
  }

  double lookup(const std::unordered_map<std::string, double>& m, const std::string& key) {
    const auto it = m.find(key);
    return it == m.end() ? 1.0 : std::max(0.0, it->second);
  }

} // namespace

const char* vibedj::history::toString(WeightScope s) {
  switch (s) {
  case WeightScope::Genre:
    return "genre";
  case WeightScope::Artist:
    return "artist";
  case WeightScope::Track:
    return "track";
  default:
    return "unknown";
  }
}

double WeightTable::combined(const std::string& title, const std::string& artistName,
                             const std::string& genreName) const {
  return lookup(track, core::trackKey(title, artistName)) *
         lookup(artist, core::normalizeKey(artistName)) * lookup(genre, core::normalizeKey(genreName));
}

WeightStore::WeightStore(std::shared_ptr<io::SqliteDatabase> db) : db_(std::move(db)) {
  if (!db_)
    throw std::invalid_argument("[WeightStore] database is nullptr");
  initSchema();
}

void WeightStore::initSchema() { db_->exec(kSchema); }

double WeightStore::factor(WeightScope scope, const std::string& name, const std::string& artist) const {
  const auto t = tableFor(scope);
  auto stmt = db_->prepare(std::string("SELECT factor FROM ") + t.table + " WHERE " + t.keyColumn + " = ?");
  stmt.bindText(1, keyFor(scope, name, artist));
  if (!stmt.step())
    return 1.0;
  return stmt.columnOptionalDouble(0).value_or(1.0);
}

double WeightStore::set(WeightScope scope, const std::string& name, double factor,
                        const std::string& artist) {
  const auto t = tableFor(scope);
  const auto key = keyFor(scope, name, artist);
  const double stored = std::max(0.0, factor);

  if (scope == WeightScope::Track) {
    auto stmt = db_->prepare(
        "INSERT INTO music_track_weights (track_key, title, artist, factor) VALUES (?, ?, ?, ?) "
        "ON CONFLICT(track_key) DO UPDATE SET factor = excluded.factor, title = excluded.title, "
        "artist = excluded.artist");
    stmt.bindText(1, key).bindText(2, core::trim(name)).bindText(3, core::trim(artist)).bindDouble(4, stored);
    stmt.step();
  } else {
    auto stmt = db_->prepare(std::string("INSERT INTO ") + t.table + " (" + t.keyColumn +
                             ", factor) VALUES (?, ?) ON CONFLICT(" + t.keyColumn +
                             ") DO UPDATE SET factor = excluded.factor");
    stmt.bindText(1, key).bindDouble(2, stored);
    stmt.step();
  }

  core::logging::get("history")->info("weight {} '{}' = {:.3f}", toString(scope), key, stored);
  return stored;
}

double WeightStore::adjust(WeightScope scope, const std::string& name, double delta,
                           const std::string& artist) {
  const double current = factor(scope, name, artist);
  double next = current + delta;
  next = delta < 0 ? std::max(kMinWeightFactor, next) : std::max(0.0, next);
  return set(scope, name, next, artist);
}

WeightTable WeightStore::loadAll() const {
  WeightTable out;
  const auto load = [this](const char* sql, std::unordered_map<std::string, double>& into) {
    auto stmt = db_->prepare(sql);
    while (stmt.step())
      into[core::normalizeKey(stmt.columnText(0))] = stmt.columnOptionalDouble(1).value_or(1.0);
  };
  load("SELECT genre, factor FROM music_genre_weights", out.genre);
  load("SELECT artist, factor FROM music_artist_weights", out.artist);
  load("SELECT track_key, factor FROM music_track_weights", out.track);
  return out;
}
