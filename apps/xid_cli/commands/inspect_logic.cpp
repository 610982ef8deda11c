#include "inspect_logic.h"

#include "xid/core/codec.h"
#include "xid/core/time.h"

#include <iomanip>
#include <sstream>

namespace {

std::string to_hex(const xid::core::Id& id) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (const auto byte : id.bytes) {
    oss << std::setw(2) << static_cast<unsigned>(byte);
  }
  return oss.str();
}

}  // namespace

nlohmann::json describe_id(const xid::core::Id& id) {
  nlohmann::json j;
  j["id"] = id.to_string();
  j["time_ns"] = id.time();
  j["time"] = xid::core::format_iso8601(id.timestamp());
  j["counter"] = id.counter();
  j["bytes"] = to_hex(id);
  return j;
}

int execute_inspect(const std::vector<std::string>& ids, std::ostream& out, std::ostream& err) {
  int exit_code = 0;
  for (const auto& text : ids) {
    auto decoded = xid::core::decode(text);
    if (!decoded.has_value()) {
      err << "Invalid id '" << text << "': " << xid::core::to_string(decoded.error()) << "\n";
      exit_code = 1;
      continue;
    }
    out << describe_id(decoded.value()).dump(2) << "\n";
  }
  return exit_code;
}
