#pragma once

#include "xid/core/id.h"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>
#include <vector>

// describe_id breaks an id into its components:
// {"id", "time_ns", "time", "counter", "bytes"}.
[[nodiscard]] nlohmann::json describe_id(const xid::core::Id& id);

// execute_inspect prints describe_id() for every decodable text in ids to out, and an
// error line to err for every one that is not. Returns 1 if any id was invalid.
int execute_inspect(const std::vector<std::string>& ids, std::ostream& out, std::ostream& err);
