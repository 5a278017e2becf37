#include "pmlink/core/version.h"

#include "commands/inspect.h"
#include "commands/match.h"
#include "commands/runs.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "Usage: pmlink_cli <command> [options]\n"
            << "Commands:\n"
            << "  match     Link two catalogs and write the one-to-one MatchSet\n"
            << "  inspect   Show entities, numbers and domain extracted from a text\n"
            << "  show-run  Print a stored MatchSet, or list stored runs\n"
            << "  audit     Print the audit trail of a run\n"
            << "  version   Print the version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string command = argv[1];
  if (command == "match") {
    return cmd_match(argc, argv);
  }
  if (command == "inspect") {
    return cmd_inspect(argc, argv);
  }
  if (command == "show-run") {
    return cmd_show_run(argc, argv);
  }
  if (command == "audit") {
    return cmd_audit(argc, argv);
  }
  if (command == "version" || command == "--version") {
    std::cout << "pmlink " << pmlink::core::kBuildVersion << "\n";
    return 0;
  }
  if (command == "help" || command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << command << "\n";
  print_usage();
  return 1;
}
