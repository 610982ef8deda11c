#pragma once

#include "xid/core/id.h"

#include <nlohmann/json.hpp>

namespace xid::core {

// nlohmann::json ADL hooks. An Id serializes as its 20-character text form.
// from_json throws nlohmann::json::type_error for non-string values and
// std::invalid_argument for strings that do not decode; id is unchanged on failure.
void to_json(nlohmann::json& j, const Id& id);
void from_json(const nlohmann::json& j, Id& id);

}  // namespace xid::core
