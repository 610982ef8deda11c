#pragma once

#include "xid/core/result.h"

#include <memory>
#include <string>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace xid::storage::sqlite {

// Milliseconds a statement waits on a lock held by another connection (e.g. a second
// xid_cli writing to the same registry file) before failing with SQLITE_BUSY.
inline constexpr int kBusyTimeoutMs = 5000;

// SqliteDb owns one connection to an id registry database.
// File databases are switched to WAL so readers never block the writer;
// ":memory:" databases are left in their default journal mode.
// Not thread-safe: use one instance per thread.
class SqliteDb {
 public:
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // Highest applied schema version, 0 on a fresh database.
  [[nodiscard]] int get_schema_version() const;

  // Create the ids table if schema v1 is not yet applied. Idempotent.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  // Raw handle for PreparedStatement and the registry.
  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

// RAII wrapper for prepared statements
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] std::string error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  // Rewind and clear bindings so the statement can run again with new parameters.
  void reset();

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

// Transaction opens BEGIN IMMEDIATE on construction and rolls back on destruction unless
// commit() succeeded. Throws std::runtime_error if BEGIN or COMMIT fails.
class Transaction {
 public:
  explicit Transaction(SqliteDb& db);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction(Transaction&&) = delete;
  Transaction& operator=(Transaction&&) = delete;

  void commit();

 private:
  SqliteDb& db_;
  bool committed_{false};
};

}  // namespace xid::storage::sqlite
