#pragma once

#include "xid/core/id.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace xid::storage {

// IdRecord remembers one minted Id with a caller-chosen label.
struct IdRecord {
  core::Id id;
  std::string label;
  std::string created_at;  // ISO 8601 UTC
};

// Registry interface isolates persistence for deterministic testing.
// Listings are ordered by Id bytes, which is K-order.
class IIdRegistry {
 public:
  virtual ~IIdRegistry() = default;
  virtual void record(const IdRecord& record) = 0;
  // Upsert every record; either all are stored or none are.
  virtual void record_all(const std::vector<IdRecord>& records) = 0;
  [[nodiscard]] virtual std::optional<IdRecord> get(const core::Id& id) const = 0;
  [[nodiscard]] virtual std::vector<IdRecord> list_all() const = 0;
  // Records whose Id::time() lies in [from_nanos, to_nanos].
  [[nodiscard]] virtual std::vector<IdRecord> list_created_between(
      std::uint64_t from_nanos, std::uint64_t to_nanos) const = 0;
};

}  // namespace xid::storage
