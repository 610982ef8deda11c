#pragma once

#include "xid/storage/id_registry.h"
#include "xid/storage/sqlite/sqlite_db.h"

#include <memory>

namespace xid::storage::sqlite {

// SqliteIdRegistry implements IIdRegistry on the ids table (schema v1).
// Ids are written as 12-byte BLOBs; rows holding the text form are read back too.
// Throws std::runtime_error if a statement fails or a stored id cannot be decoded.
class SqliteIdRegistry final : public IIdRegistry {
 public:
  explicit SqliteIdRegistry(std::shared_ptr<SqliteDb> db);

  void record(const IdRecord& record) override;
  void record_all(const std::vector<IdRecord>& records) override;
  [[nodiscard]] std::optional<IdRecord> get(const core::Id& id) const override;
  [[nodiscard]] std::vector<IdRecord> list_all() const override;
  [[nodiscard]] std::vector<IdRecord> list_created_between(std::uint64_t from_nanos,
                                                           std::uint64_t to_nanos) const override;

 private:
  std::shared_ptr<SqliteDb> db_;

  [[nodiscard]] static IdRecord row_to_record(sqlite3_stmt* stmt);
};

}  // namespace xid::storage::sqlite
