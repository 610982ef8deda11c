#pragma once

namespace xid::core {

// kBuildVersion is the current software version string.
constexpr const char* kBuildVersion = "1.0";

}  // namespace xid::core
