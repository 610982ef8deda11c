#include "xid/core/version.h"

#include "commands/generate.h"
#include "commands/inspect.h"
#include <iostream>
#include <string>

namespace {

void print_usage(std::ostream& os) {
  os << "xid_cli v" << xid::core::kBuildVersion << "\n"
     << "Usage: xid_cli <command> [options]\n"
     << "Commands:\n"
     << "  generate   Mint new identifiers (default)\n"
     << "  inspect    Show the timestamp and counter of existing identifiers\n"
     << "Run 'xid_cli <command> --help' for command options.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    return cmd_generate(argc, argv);
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "inspect") {
    return cmd_inspect(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "-h") {
    print_usage(std::cout);
    return 0;
  }
  if (subcommand == "--version") {
    std::cout << xid::core::kBuildVersion << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage(std::cerr);
  return 1;
}
