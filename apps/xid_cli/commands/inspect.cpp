#include "inspect.h"

#include "inspect_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct InspectCliConfig {
  bool help{false};
};

}  // namespace

int cmd_inspect(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<xid::apps::Option<InspectCliConfig>> options = {
      {"--help", false, "Show this help",
       [](InspectCliConfig& c, const std::string& /*v*/) {
         c.help = true;
         return true;
       }},
  };

  std::vector<std::string> ids;
  bool args_ok = true;
  auto config =
      xid::apps::parse_options(argc, argv, options, 2, InspectCliConfig{}, &ids, &args_ok);
  if (!args_ok) {
    return 1;
  }

  if (config.help || ids.empty()) {
    xid::apps::print_usage(config.help ? std::cout : std::cerr, "xid_cli inspect <id> [<id> ...]",
                           options);
    return config.help ? 0 : 1;
  }

  return execute_inspect(ids, std::cout, std::cerr);
}
