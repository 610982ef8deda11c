#include "xid/storage/sqlite/sqlite_column.h"

#include <sqlite3.h>

#include <type_traits>

namespace xid::storage::sqlite {

bool bind_column_value(sqlite3_stmt* stmt, const int index, const ColumnValue& value) {
  const int rc = std::visit(
      [&](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
          return sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return sqlite3_bind_text(stmt, index, v.data(), static_cast<int>(v.size()),
                                   SQLITE_TRANSIENT);
        } else {
          // A null data pointer would bind NULL instead of an empty BLOB.
          if (v.empty()) {
            return sqlite3_bind_zeroblob(stmt, index, 0);
          }
          return sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()),
                                   SQLITE_TRANSIENT);
        }
      },
      value);
  return rc == SQLITE_OK;
}

ColumnValue read_column_value(sqlite3_stmt* stmt, const int column) {
  switch (sqlite3_column_type(stmt, column)) {
    case SQLITE_INTEGER:
      return static_cast<std::int64_t>(sqlite3_column_int64(stmt, column));
    case SQLITE_FLOAT:
      return sqlite3_column_double(stmt, column);
    case SQLITE_TEXT: {
      const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
      const int size = sqlite3_column_bytes(stmt, column);
      return std::string(text != nullptr ? text : "", static_cast<std::size_t>(size));
    }
    case SQLITE_BLOB: {
      const auto* data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, column));
      const int size = sqlite3_column_bytes(stmt, column);
      if (data == nullptr) {
        return Blob{};
      }
      return Blob(data, data + size);
    }
    default:
      return std::monostate{};
  }
}

bool bind_id(sqlite3_stmt* stmt, const int index, const core::Id& id) {
  return bind_column_value(stmt, index, to_column_value(id));
}

core::Result<core::Id, std::string> read_id(sqlite3_stmt* stmt, const int column) {
  return from_column_value(read_column_value(stmt, column));
}

}  // namespace xid::storage::sqlite
