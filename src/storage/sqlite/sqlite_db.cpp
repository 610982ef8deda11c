#include "xid/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

#include <stdexcept>

namespace xid::storage::sqlite {

namespace {

// ids.id holds the raw 12-byte form; BLOB comparison is memcmp, so ORDER BY id is K-order.
// Single transaction: a failure part way leaves the database at version 0.
constexpr const char* kSchemaV1 = R"(
BEGIN;

CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS ids (
  id BLOB PRIMARY KEY,
  label TEXT NOT NULL,
  created_at TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS ids_label ON ids (label);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, strftime('%Y-%m-%dT%H:%M:%fZ', 'now'));

COMMIT;
)";

core::Result<bool, std::string> run_script(sqlite3* db, const char* sql,
                                           const std::string& context) {
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
  if (rc == SQLITE_OK) {
    return core::Result<bool, std::string>::ok(true);
  }
  std::string error = err_msg != nullptr ? err_msg : sqlite3_errstr(rc);
  sqlite3_free(err_msg);
  return core::Result<bool, std::string>::err(context + ": " + error);
}

}  // namespace

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using OpenResult = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* raw = nullptr;
  const int rc =
      sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  // Owned from here on, even when open failed.
  std::shared_ptr<SqliteDb> db(new SqliteDb(raw));
  if (rc != SQLITE_OK) {
    const std::string error = raw != nullptr ? sqlite3_errmsg(raw) : "out of memory";
    return OpenResult::err("Failed to open database '" + path + "': " + error);
  }

  sqlite3_busy_timeout(raw, kBusyTimeoutMs);

  if (path != ":memory:") {
    auto wal = run_script(raw, "PRAGMA journal_mode=WAL", "Failed to enable WAL");
    if (!wal.has_value()) {
      return OpenResult::err(wal.error());
    }
  }

  return OpenResult::ok(std::move(db));
}

int SqliteDb::get_schema_version() const {
  PreparedStatement stmt(db_.get(), "SELECT MAX(version) FROM schema_version");
  if (!stmt.is_valid()) {
    return 0;  // schema_version does not exist yet
  }
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return 0;
  }
  return sqlite3_column_int(stmt.get(), 0);  // NULL reads as 0
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v1() {
  if (get_schema_version() >= 1) {
    return core::Result<bool, std::string>::ok(true);
  }
  auto applied = run_script(db_.get(), kSchemaV1, "Failed to apply schema v1");
  if (!applied.has_value() && sqlite3_get_autocommit(db_.get()) == 0) {
    sqlite3_exec(db_.get(), "ROLLBACK", nullptr, nullptr, nullptr);
  }
  return applied;
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  return run_script(db_.get(), sql.c_str(), "SQL execution failed");
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr) != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    sqlite3_finalize(raw_stmt);
    return;
  }
  stmt_.reset(raw_stmt);
}

void PreparedStatement::reset() {
  if (stmt_) {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
  }
}

Transaction::Transaction(SqliteDb& db) : db_(db) {
  auto begun = db_.exec("BEGIN IMMEDIATE");
  if (!begun.has_value()) {
    throw std::runtime_error("Transaction: " + begun.error());
  }
}

Transaction::~Transaction() {
  if (!committed_) {
    sqlite3_exec(db_.connection(), "ROLLBACK", nullptr, nullptr, nullptr);
  }
}

void Transaction::commit() {
  auto done = db_.exec("COMMIT");
  if (!done.has_value()) {
    throw std::runtime_error("Transaction: " + done.error());
  }
  committed_ = true;
}

}  // namespace xid::storage::sqlite
