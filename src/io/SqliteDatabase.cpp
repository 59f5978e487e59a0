/* @file SqliteDatabase.cpp
 * @brief sqlite3 C API ownership: open/close, prepare/finalize, typed binds and columns
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <utility>

// VibeDJ headers
#include "core/Errors.hpp"
#include "io/SqliteDatabase.hpp"

using namespace vibedj::io;
using vibedj::core::StoreError;

//---SqliteStatement-------------------------------------------------

SqliteStatement::SqliteStatement(sqlite3* db, const std::string& sql) : db_(db) {
  if (db_ == nullptr)
    throw StoreError("[Sqlite] prepare on a closed database");
  const int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    std::string err = std::string("[Sqlite] prepare failed: ") + sqlite3_errmsg(db_) + " sql=" + sql;
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    throw StoreError(err);
  }
}

SqliteStatement::~SqliteStatement() {
  if (stmt_ != nullptr)
    sqlite3_finalize(stmt_);
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), stmt_(std::exchange(other.stmt_, nullptr)) {}

SqliteStatement& SqliteStatement::operator=(SqliteStatement&& other) noexcept {
  if (this != &other) {
    if (stmt_ != nullptr)
      sqlite3_finalize(stmt_);
    db_ = std::exchange(other.db_, nullptr);
    stmt_ = std::exchange(other.stmt_, nullptr);
  }
  return *this;
}

void SqliteStatement::check(int rc, const char* what) const {
  if (rc != SQLITE_OK)
    throw StoreError(std::string("[Sqlite] ") + what + " failed: " + sqlite3_errmsg(db_));
}

SqliteStatement& SqliteStatement::bindInt(int idx, int value) {
  check(sqlite3_bind_int(stmt_, idx, value), "bind");
  return *this;
}

SqliteStatement& SqliteStatement::bindInt64(int idx, std::int64_t value) {
  check(sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value)), "bind");
  return *this;
}

SqliteStatement& SqliteStatement::bindDouble(int idx, double value) {
  check(sqlite3_bind_double(stmt_, idx, value), "bind");
  return *this;
}

SqliteStatement& SqliteStatement::bindText(int idx, const std::string& value) {
  check(sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
        "bind");
  return *this;
}

SqliteStatement& SqliteStatement::bindNull(int idx) {
  check(sqlite3_bind_null(stmt_, idx), "bind");
  return *this;
}

SqliteStatement& SqliteStatement::bindOptionalInt(int idx, const std::optional<int>& value) {
  return value ? bindInt(idx, *value) : bindNull(idx);
}

bool SqliteStatement::step() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW)
    return true;
  if (rc == SQLITE_DONE)
    return false;
  throw StoreError(std::string("[Sqlite] step failed: ") + sqlite3_errmsg(db_));
}

void SqliteStatement::reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

bool SqliteStatement::isNull(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

int SqliteStatement::columnInt(int col) const { return sqlite3_column_int(stmt_, col); }

std::int64_t SqliteStatement::columnInt64(int col) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, col));
}

double SqliteStatement::columnDouble(int col) const { return sqlite3_column_double(stmt_, col); }

std::string SqliteStatement::columnText(int col) const {
  const auto* text = sqlite3_column_text(stmt_, col);
  if (text == nullptr)
    return {};
  return std::string(reinterpret_cast<const char*>(text),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col)));
}

std::optional<double> SqliteStatement::columnOptionalDouble(int col) const {
  if (isNull(col))
    return std::nullopt;
  return columnDouble(col);
}

std::optional<int> SqliteStatement::columnOptionalInt(int col) const {
  if (isNull(col))
    return std::nullopt;
  return columnInt(col);
}

std::optional<std::int64_t> SqliteStatement::columnOptionalInt64(int col) const {
  if (isNull(col))
    return std::nullopt;
  return columnInt64(col);
}

//---SqliteDatabase--------------------------------------------------

SqliteDatabase::SqliteDatabase(std::string path) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
  if (rc != SQLITE_OK) {
    std::string err = "[Sqlite] open failed: " + path_ + ": " +
                      (db_ != nullptr ? sqlite3_errmsg(db_) : "out of memory");
    sqlite3_close(db_);
    db_ = nullptr;
    throw StoreError(err);
  }
  sqlite3_busy_timeout(db_, 2000);
}

SqliteDatabase::~SqliteDatabase() {
  if (db_ != nullptr)
    sqlite3_close(db_);
}

void SqliteDatabase::exec(const std::string& sql) {
  char* errMsg = nullptr;
  const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
  if (rc != SQLITE_OK) {
    std::string err = std::string("[Sqlite] exec failed: ") + (errMsg != nullptr ? errMsg : "unknown");
    sqlite3_free(errMsg);
    throw StoreError(err);
  }
}

SqliteStatement SqliteDatabase::prepare(const std::string& sql) { return SqliteStatement(db_, sql); }

bool SqliteDatabase::tableExists(const std::string& name) {
  auto stmt = prepare("SELECT 1 FROM sqlite_master WHERE type='table' AND name=?");
  stmt.bindText(1, name);
  return stmt.step();
}
