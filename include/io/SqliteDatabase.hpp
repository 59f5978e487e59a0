#pragma once
/** @file  SqliteDatabase.hpp
 *  @brief RAII wrappers around a sqlite3 connection and its prepared statements.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>

// third-party headers
#include <sqlite3.h>

namespace vibedj {
  namespace io {

    /**
 * @class SqliteStatement
 * @brief One prepared statement; finalized at destruction.
 *
 *  * Bind indices are 1-based, column indices 0-based (sqlite3 conventions).
 *  * Every failure throws `core::StoreError` carrying sqlite3_errmsg().
 *  * *Non-copyable*, but move-constructible.
 */
    class SqliteStatement {
    public:
      SqliteStatement(sqlite3* db, const std::string& sql);
      ~SqliteStatement();

      //---public API-------------------------------------------
      SqliteStatement& bindInt(int idx, int value);
      SqliteStatement& bindInt64(int idx, std::int64_t value);
      SqliteStatement& bindDouble(int idx, double value);
      SqliteStatement& bindText(int idx, const std::string& value);
      SqliteStatement& bindNull(int idx);
      SqliteStatement& bindOptionalInt(int idx, const std::optional<int>& value);

      /// @returns true while a row is available, false once the statement is done.
      bool step();
      void reset();

      bool isNull(int col) const;
      int columnInt(int col) const;
      std::int64_t columnInt64(int col) const;
      double columnDouble(int col) const;
      std::string columnText(int col) const;
      std::optional<double> columnOptionalDouble(int col) const;
      std::optional<int> columnOptionalInt(int col) const;
      std::optional<std::int64_t> columnOptionalInt64(int col) const;

      //---non-copyable-----------------------------------------
      SqliteStatement(const SqliteStatement&) = delete;
      SqliteStatement& operator=(const SqliteStatement&) = delete;

      //---mv and mv assign-------------------------------------
      SqliteStatement(SqliteStatement&& other) noexcept;
      SqliteStatement& operator=(SqliteStatement&& other) noexcept;

    private:
      void check(int rc, const char* what) const;

      sqlite3* db_{ nullptr };        ///< not owned
      sqlite3_stmt* stmt_{ nullptr }; ///< owned
    };

    /**
 * @class SqliteDatabase
 * @brief Owns one sqlite3 connection. Not thread-safe: one owning thread at a time.
 */
    class SqliteDatabase {
    public:
      /// Opens (creating if needed) \p path; ":memory:" for tests. Throws `core::StoreError`.
      explicit SqliteDatabase(std::string path);
      ~SqliteDatabase();

      //---public API-------------------------------------------
      void exec(const std::string& sql);
      SqliteStatement prepare(const std::string& sql);
      bool tableExists(const std::string& name);
      const std::string& path() const { return path_; }

      //---non-copyable, non-movable----------------------------
      SqliteDatabase(const SqliteDatabase&) = delete;
      SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    private:
      std::string path_;
      sqlite3* db_{ nullptr };
    };

  } // namespace io
} // namespace vibedj
