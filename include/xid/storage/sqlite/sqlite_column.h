#pragma once

#include "xid/core/id.h"
#include "xid/core/result.h"
#include "xid/storage/column_value.h"

#include <string>

struct sqlite3_stmt;

namespace xid::storage::sqlite {

// Bind value to the 1-based parameter index. Returns false if SQLite rejects the bind.
[[nodiscard]] bool bind_column_value(sqlite3_stmt* stmt, int index, const ColumnValue& value);

// Read the 0-based result column of the current row, keeping its storage class.
[[nodiscard]] ColumnValue read_column_value(sqlite3_stmt* stmt, int column);

// Ids are written as BLOB; reads accept TEXT or BLOB (see from_column_value).
[[nodiscard]] bool bind_id(sqlite3_stmt* stmt, int index, const core::Id& id);
[[nodiscard]] core::Result<core::Id, std::string> read_id(sqlite3_stmt* stmt, int column);

}  // namespace xid::storage::sqlite
