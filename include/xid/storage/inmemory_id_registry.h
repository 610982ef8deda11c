#pragma once

#include "xid/storage/id_registry.h"

#include <map>

namespace xid::storage {

// InMemoryIdRegistry stores IdRecords in a std::map keyed (and therefore ordered) by Id.
class InMemoryIdRegistry final : public IIdRegistry {
 public:
  void record(const IdRecord& record) override;
  void record_all(const std::vector<IdRecord>& records) override;
  [[nodiscard]] std::optional<IdRecord> get(const core::Id& id) const override;
  [[nodiscard]] std::vector<IdRecord> list_all() const override;
  [[nodiscard]] std::vector<IdRecord> list_created_between(std::uint64_t from_nanos,
                                                           std::uint64_t to_nanos) const override;

 private:
  std::map<core::Id, IdRecord> records_;
};

}  // namespace xid::storage
