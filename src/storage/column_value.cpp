#include "xid/storage/column_value.h"

#include "xid/core/codec.h"

#include <type_traits>

namespace xid::storage {

std::string_view column_type_name(const ColumnValue& value) {
  return std::visit(
      [](const auto& v) -> std::string_view {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return "null";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return "integer";
        } else if constexpr (std::is_same_v<T, double>) {
          return "real";
        } else if constexpr (std::is_same_v<T, std::string>) {
          return "text";
        } else {
          return "blob";
        }
      },
      value);
}

ColumnValue to_column_value(const core::Id& id) {
  return Blob(id.bytes.begin(), id.bytes.end());
}

core::Result<core::Id, std::string> from_column_value(const ColumnValue& value) {
  using IdResult = core::Result<core::Id, std::string>;

  if (const auto* text = std::get_if<std::string>(&value)) {
    auto decoded = core::decode(*text);
    if (!decoded.has_value()) {
      return IdResult::err(std::string(core::to_string(decoded.error())));
    }
    return IdResult::ok(decoded.value());
  }

  if (const auto* blob = std::get_if<Blob>(&value)) {
    auto parsed = core::Id::from_bytes(*blob);
    if (!parsed.has_value()) {
      return IdResult::err("xid: scanning byte slice invalid length: " +
                           std::to_string(blob->size()));
    }
    return IdResult::ok(parsed.value());
  }

  return IdResult::err("xid: scanning unsupported type: " +
                       std::string(column_type_name(value)));
}

}  // namespace xid::storage
