#include "xid/core/id_json.h"

#include "xid/core/codec.h"

#include <stdexcept>
#include <string>

namespace xid::core {

void to_json(nlohmann::json& j, const Id& id) {
  j = encode(id);
}

void from_json(const nlohmann::json& j, Id& id) {
  const auto& text = j.get_ref<const std::string&>();
  auto decoded = decode(text);
  if (!decoded.has_value()) {
    throw std::invalid_argument(std::string(to_string(decoded.error())));
  }
  id = decoded.value();
}

}  // namespace xid::core
