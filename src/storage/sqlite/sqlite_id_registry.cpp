#include "xid/storage/sqlite/sqlite_id_registry.h"

#include "xid/core/codec.h"
#include "xid/storage/sqlite/sqlite_column.h"

#include <sqlite3.h>

#include <algorithm>
#include <stdexcept>

namespace xid::storage::sqlite {

SqliteIdRegistry::SqliteIdRegistry(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

namespace {

constexpr const char* kUpsertSql = R"(
  INSERT INTO ids (id, label, created_at)
  VALUES (?, ?, ?)
  ON CONFLICT(id) DO UPDATE SET
    label = excluded.label,
    created_at = excluded.created_at
)";

// Rows written elsewhere may hold the text form; the BLOB row replaces them.
constexpr const char* kDeleteTextFormSql = "DELETE FROM ids WHERE id = ?";

}  // namespace

void SqliteIdRegistry::record(const IdRecord& record) {
  record_all({record});
}

void SqliteIdRegistry::record_all(const std::vector<IdRecord>& records) {
  Transaction tx(*db_);

  PreparedStatement remove_text(db_->connection(), kDeleteTextFormSql);
  if (!remove_text.is_valid()) {
    throw std::runtime_error("SqliteIdRegistry::record failed to prepare: " + remove_text.error());
  }
  PreparedStatement stmt(db_->connection(), kUpsertSql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("SqliteIdRegistry::record failed to prepare: " + stmt.error());
  }

  for (const auto& record : records) {
    remove_text.reset();
    if (!bind_column_value(remove_text.get(), 1, core::encode(record.id)) ||
        sqlite3_step(remove_text.get()) != SQLITE_DONE) {
      throw std::runtime_error("SqliteIdRegistry::record failed: " +
                               std::string(sqlite3_errmsg(db_->connection())));
    }

    stmt.reset();
    const bool bound = bind_id(stmt.get(), 1, record.id) &&
                       bind_column_value(stmt.get(), 2, record.label) &&
                       bind_column_value(stmt.get(), 3, record.created_at);
    if (!bound || sqlite3_step(stmt.get()) != SQLITE_DONE) {
      throw std::runtime_error("SqliteIdRegistry::record failed: " +
                               std::string(sqlite3_errmsg(db_->connection())));
    }
  }

  tx.commit();
}

std::optional<IdRecord> SqliteIdRegistry::get(const core::Id& id) const {
  // Rows written elsewhere may hold the text form instead of the BLOB.
  const char* sql = "SELECT id, label, created_at FROM ids WHERE id = ? OR id = ?";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("SqliteIdRegistry::get failed to prepare: " + stmt.error());
  }

  if (!bind_id(stmt.get(), 1, id) || !bind_column_value(stmt.get(), 2, core::encode(id))) {
    throw std::runtime_error("SqliteIdRegistry::get failed to bind id");
  }

  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return row_to_record(stmt.get());
  }

  return std::nullopt;
}

std::vector<IdRecord> SqliteIdRegistry::list_all() const {
  const char* sql = "SELECT id, label, created_at FROM ids";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("SqliteIdRegistry::list_all failed to prepare: " + stmt.error());
  }

  std::vector<IdRecord> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    result.push_back(row_to_record(stmt.get()));
  }

  // SQLite sorts TEXT before BLOB, so order on the decoded Id instead of ORDER BY id.
  std::sort(result.begin(), result.end(),
            [](const IdRecord& a, const IdRecord& b) { return a.id < b.id; });
  return result;
}

std::vector<IdRecord> SqliteIdRegistry::list_created_between(const std::uint64_t from_nanos,
                                                             const std::uint64_t to_nanos) const {
  std::vector<IdRecord> result = list_all();
  std::erase_if(result, [&](const IdRecord& r) {
    const auto t = r.id.time();
    return t < from_nanos || t > to_nanos;
  });
  return result;
}

IdRecord SqliteIdRegistry::row_to_record(sqlite3_stmt* stmt) {
  auto id = read_id(stmt, 0);
  if (!id.has_value()) {
    throw std::runtime_error("SqliteIdRegistry: corrupt id column: " + id.error());
  }

  IdRecord record;
  record.id = id.value();
  record.label = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
  record.created_at = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
  return record;
}

}  // namespace xid::storage::sqlite
