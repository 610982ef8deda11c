#pragma once

#include "xid/core/id.h"
#include "xid/core/result.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace xid::storage {

using Blob = std::vector<std::uint8_t>;

// ColumnValue is an opaque database column value, one alternative per SQL storage class:
// NULL, INTEGER, REAL, TEXT, BLOB.
using ColumnValue = std::variant<std::monostate, std::int64_t, double, std::string, Blob>;

// column_type_name returns "null", "integer", "real", "text" or "blob".
[[nodiscard]] std::string_view column_type_name(const ColumnValue& value);

// to_column_value stores an Id as its raw 12-byte BLOB.
[[nodiscard]] ColumnValue to_column_value(const core::Id& id);

// from_column_value accepts the 20-character text form or the raw 12-byte form.
// Errors name the offending length or storage class.
[[nodiscard]] core::Result<core::Id, std::string> from_column_value(const ColumnValue& value);

}  // namespace xid::storage
