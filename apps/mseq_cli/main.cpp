#include "commands/audit.h"
#include "commands/category.h"
#include "commands/config.h"
#include "commands/generate.h"
#include "commands/machine.h"
#include "commands/redis_health.h"
#include "commands/reformat.h"
#include "commands/swap_format.h"

#include "mseq/core/version.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "mseq_cli " << mseq::core::kBuildVersion << "\n"
            << "Usage: mseq_cli <command> [options]\n\n"
            << "Commands:\n"
            << "  category      add or list categories and subcategories\n"
            << "  machine       add, list, assign an identifier to, or delete machines\n"
            << "  config        manage sequence configurations\n"
            << "  generate      issue the next identifier for a scope\n"
            << "  reformat      re-render existing identifiers after a template change\n"
            << "  swap-format   rewrite {category}-first templates to {sequence}-first\n"
            << "  audit         show the audit events of a trace\n"
            << "  redis-health  check the Redis counter backend\n\n"
            << "Common options: --db <path> --counter-backend sqlite|redis --redis <uri>\n"
            << "                --actor <name> --trace <id>\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "category") {
    return cmd_category(argc, argv);
  }
  if (subcommand == "machine") {
    return cmd_machine(argc, argv);
  }
  if (subcommand == "config") {
    return cmd_config(argc, argv);
  }
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "reformat") {
    return cmd_reformat(argc, argv);
  }
  if (subcommand == "swap-format") {
    return cmd_swap_format(argc, argv);
  }
  if (subcommand == "audit") {
    return cmd_audit(argc, argv);
  }
  if (subcommand == "redis-health") {
    return cmd_redis_health(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
