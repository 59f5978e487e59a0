/* @file HistoryStore.cpp
 * @brief played_songs schema, upsert with period resets, and history queries
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>
#include <string>

// third-party headers
#include <spdlog/spdlog.h>

// VibeDJ headers
#include "core/Logging.hpp"
#include "core/SearchQuery.hpp"
#include "history/HistoryStore.hpp"
#include "io/SqliteDatabase.hpp"

using namespace vibedj::history;
using vibedj::core::AudioTargets;
using vibedj::core::TimePoint;

namespace {

  constexpr const char* kSchema = R"sql(
    CREATE TABLE IF NOT EXISTS played_songs (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      title TEXT NOT NULL,
      artist TEXT NOT NULL,
      title_norm TEXT NOT NULL,
      artist_norm TEXT NOT NULL,
      search_query TEXT,
      first_played_ms INTEGER NOT NULL,
      last_played_ms INTEGER NOT NULL,
      play_count_today INTEGER NOT NULL DEFAULT 1,
      play_count_week INTEGER NOT NULL DEFAULT 1,
      play_count_month INTEGER NOT NULL DEFAULT 1,
      play_count_year INTEGER NOT NULL DEFAULT 1,
      play_count_all_time INTEGER NOT NULL DEFAULT 1,
      last_energy_slider INTEGER,
      last_valence_slider INTEGER,
      last_loudness_slider INTEGER,
      last_speechiness_slider INTEGER,
      last_acousticness_slider INTEGER,
      last_instrumentalness_slider INTEGER,
      last_liveness_slider INTEGER,
      last_tempo_slider INTEGER,
      last_count_reset_date TEXT,
      UNIQUE (title_norm, artist_norm)
    );
    CREATE INDEX IF NOT EXISTS idx_played_songs_last_played ON played_songs (last_played_ms);
    CREATE INDEX IF NOT EXISTS idx_played_songs_artist_norm ON played_songs (artist_norm);
  )sql";

  // Column order shared by every SELECT below and by readRecord().
  constexpr const char* kColumns =
      "id, title, artist, search_query, first_played_ms, last_played_ms, "
      "play_count_today, play_count_week, play_count_month, play_count_year, play_count_all_time, "
      "last_energy_slider, last_valence_slider, last_loudness_slider, last_speechiness_slider, "
      "last_acousticness_slider, last_instrumentalness_slider, last_liveness_slider, last_tempo_slider, "
      "last_count_reset_date";

  constexpr int kFirstSliderColumn = 11;

  HistoryRecord readRecord(const vibedj::io::SqliteStatement& stmt) {
    HistoryRecord r;
    r.id = stmt.columnInt64(0);
    r.title = stmt.columnText(1);
    r.artist = stmt.columnText(2);
    r.searchQuery = stmt.columnText(3);
    r.firstPlayed = vibedj::core::fromUnixMillis(stmt.columnInt64(4));
    r.lastPlayed = vibedj::core::fromUnixMillis(stmt.columnInt64(5));
    r.playsToday = stmt.columnInt(6);
    r.playsWeek = stmt.columnInt(7);
    r.playsMonth = stmt.columnInt(8);
    r.playsYear = stmt.columnInt(9);
    r.playsAllTime = stmt.columnInt(10);
    for (std::size_t i = 0; i < vibedj::core::kFeatureCount; ++i)
      r.lastTargets[i] = stmt.columnOptionalInt(kFirstSliderColumn + static_cast<int>(i));
    r.lastResetDate = stmt.columnText(kFirstSliderColumn + static_cast<int>(vibedj::core::kFeatureCount));
    return r;
  }

} // namespace

HistoryStore::HistoryStore(std::shared_ptr<io::SqliteDatabase> db) : db_(std::move(db)) {
  if (!db_)
    throw std::invalid_argument("[HistoryStore] database is nullptr");
  initSchema();
}

void HistoryStore::initSchema() { db_->exec(kSchema); }

void HistoryStore::applyPeriodReset(HistoryRecord& record, TimePoint now) {
  const std::string today = core::utcDateString(now);
  const auto lastReset = record.lastResetDate.empty() ? std::nullopt
                                                      : core::parseUtcDateString(record.lastResetDate);
  if (!lastReset) {
    record.lastResetDate = today;
    return;
  }

  const auto last = core::utcDate(*lastReset);
  const auto cur = core::utcDate(now);

  if (today != record.lastResetDate)
    record.playsToday = 0;
  if (cur.isoWeek != last.isoWeek || cur.year != last.year)
    record.playsWeek = 0;
  if (cur.month != last.month || cur.year != last.year)
    record.playsMonth = 0;
  if (cur.year != last.year)
    record.playsYear = 0;

  record.lastResetDate = today;
}

std::optional<HistoryRecord> HistoryStore::find(const std::string& title, const std::string& artist) {
  auto stmt = db_->prepare(std::string("SELECT ") + kColumns +
                           " FROM played_songs WHERE title_norm = ? AND artist_norm = ?");
  stmt.bindText(1, core::normalizeKey(title)).bindText(2, core::normalizeKey(artist));
  if (!stmt.step())
    return std::nullopt;
  return readRecord(stmt);
}

HistoryRecord HistoryStore::recordPlay(const std::string& title, const std::string& artist,
                                       const std::optional<std::string>& searchQuery,
                                       const std::optional<AudioTargets>& targets, TimePoint now) {
  auto log = core::logging::get("history");
  const auto nowMs = core::toUnixMillis(now);

  auto existing = find(title, artist);
  if (!existing) {
    HistoryRecord r;
    r.title = core::trim(title);
    r.artist = core::trim(artist);
    r.searchQuery = searchQuery.value_or(std::string{});
    r.firstPlayed = now;
    r.lastPlayed = now;
    r.playsToday = r.playsWeek = r.playsMonth = r.playsYear = r.playsAllTime = 1;
    r.lastResetDate = core::utcDateString(now);
    if (targets)
      r.lastTargets = targets->toSnapshot();

    auto stmt = db_->prepare(
        "INSERT INTO played_songs (title, artist, title_norm, artist_norm, search_query, "
        "first_played_ms, last_played_ms, play_count_today, play_count_week, play_count_month, "
        "play_count_year, play_count_all_time, last_energy_slider, last_valence_slider, "
        "last_loudness_slider, last_speechiness_slider, last_acousticness_slider, "
        "last_instrumentalness_slider, last_liveness_slider, last_tempo_slider, last_count_reset_date) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, 1, 1, 1, 1, 1, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.bindText(1, r.title)
        .bindText(2, r.artist)
        .bindText(3, core::normalizeKey(title))
        .bindText(4, core::normalizeKey(artist));
    if (searchQuery)
      stmt.bindText(5, *searchQuery);
    else
      stmt.bindNull(5);
    stmt.bindInt64(6, nowMs).bindInt64(7, nowMs);
    for (std::size_t i = 0; i < core::kFeatureCount; ++i)
      stmt.bindOptionalInt(8 + static_cast<int>(i), r.lastTargets[i]);
    stmt.bindText(16, r.lastResetDate);
    stmt.step();

    if (auto stored = find(title, artist))
      r.id = stored->id;
    log->info("recorded first play '{}' by {}", r.title, r.artist);
    return r;
  }

  HistoryRecord r = *existing;
  applyPeriodReset(r, now);
  r.lastPlayed = now;
  ++r.playsToday;
  ++r.playsWeek;
  ++r.playsMonth;
  ++r.playsYear;
  ++r.playsAllTime;
  if (searchQuery && !searchQuery->empty())
    r.searchQuery = *searchQuery;
  if (targets)
    r.lastTargets = targets->toSnapshot();

  auto stmt = db_->prepare(
      "UPDATE played_songs SET search_query = ?, last_played_ms = ?, play_count_today = ?, "
      "play_count_week = ?, play_count_month = ?, play_count_year = ?, play_count_all_time = ?, "
      "last_energy_slider = ?, last_valence_slider = ?, last_loudness_slider = ?, "
      "last_speechiness_slider = ?, last_acousticness_slider = ?, last_instrumentalness_slider = ?, "
      "last_liveness_slider = ?, last_tempo_slider = ?, last_count_reset_date = ? WHERE id = ?");
  stmt.bindText(1, r.searchQuery)
      .bindInt64(2, nowMs)
      .bindInt(3, r.playsToday)
      .bindInt(4, r.playsWeek)
      .bindInt(5, r.playsMonth)
      .bindInt(6, r.playsYear)
      .bindInt(7, r.playsAllTime);
  for (std::size_t i = 0; i < core::kFeatureCount; ++i)
    stmt.bindOptionalInt(8 + static_cast<int>(i), r.lastTargets[i]);
  stmt.bindText(16, r.lastResetDate).bindInt64(17, r.id);
  stmt.step();

  log->info("recorded replay '{}' by {} today={} all_time={}", r.title, r.artist, r.playsToday,
            r.playsAllTime);
  return r;
}

PlayStats HistoryStore::stats(const std::string& title, const std::string& artist, TimePoint now) {
  PlayStats out;
  auto record = find(title, artist);
  if (!record)
    return out;

  applyPeriodReset(*record, now);
  out.found = true;
  out.playsToday = record->playsToday;
  out.playsWeek = record->playsWeek;
  out.playsAllTime = record->playsAllTime;
  out.hoursSinceLast = core::hoursBetween(record->lastPlayed, now);
  return out;
}

std::optional<double> HistoryStore::artistHoursSinceLast(const std::string& artist, TimePoint now) {
  const auto key = core::normalizeKey(artist);
  if (key.empty())
    return std::nullopt;

  auto stmt = db_->prepare("SELECT MAX(last_played_ms) FROM played_songs WHERE artist_norm = ?");
  stmt.bindText(1, key);
  if (!stmt.step())
    return std::nullopt;
  const auto lastMs = stmt.columnOptionalInt64(0);
  if (!lastMs)
    return std::nullopt;
  return core::hoursBetween(core::fromUnixMillis(*lastMs), now);
}

std::vector<HistoryRecord> HistoryStore::recentlyPlayed(std::size_t limit) {
  std::vector<HistoryRecord> out;
  auto stmt = db_->prepare(std::string("SELECT ") + kColumns +
                           " FROM played_songs ORDER BY last_played_ms DESC, id DESC LIMIT ?");
  stmt.bindInt64(1, static_cast<std::int64_t>(limit));
  while (stmt.step())
    out.push_back(readRecord(stmt));
  std::reverse(out.begin(), out.end());
  return out;
}

std::optional<HistoryRecord> HistoryStore::lastPlayed() {
  auto stmt = db_->prepare(std::string("SELECT ") + kColumns +
                           " FROM played_songs ORDER BY last_played_ms DESC, id DESC LIMIT 1");
  if (!stmt.step())
    return std::nullopt;
  return readRecord(stmt);
}
