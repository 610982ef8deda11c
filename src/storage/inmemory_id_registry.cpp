#include "xid/storage/inmemory_id_registry.h"

namespace xid::storage {

void InMemoryIdRegistry::record(const IdRecord& record) {
  records_[record.id] = record;
}

void InMemoryIdRegistry::record_all(const std::vector<IdRecord>& records) {
  for (const auto& r : records) {
    records_[r.id] = r;
  }
}

std::optional<IdRecord> InMemoryIdRegistry::get(const core::Id& id) const {
  auto it = records_.find(id);
  if (it != records_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<IdRecord> InMemoryIdRegistry::list_all() const {
  std::vector<IdRecord> result;
  result.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    result.push_back(record);
  }
  return result;
}

std::vector<IdRecord> InMemoryIdRegistry::list_created_between(const std::uint64_t from_nanos,
                                                               const std::uint64_t to_nanos) const {
  std::vector<IdRecord> result;
  for (const auto& [id, record] : records_) {
    const auto t = id.time();
    if (t >= from_nanos && t <= to_nanos) {
      result.push_back(record);
    }
  }
  return result;
}

}  // namespace xid::storage
