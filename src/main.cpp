#include "cli/registry.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  strata::cli::register_all_commands(); // defined in register_commands.cpp

  if (argc < 2) {
    strata::cli::print_usage();
    return 2;
  }
  const std::string cmd = argv[1];
  if (cmd == "help" || cmd == "--help" || cmd == "-h") {
    strata::cli::print_usage();
    return 0;
  }

  const auto fn = strata::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "strata: unknown command '" << cmd << "' (no repository was opened)\n";
    strata::cli::print_usage();
    return 2;
  }
  // Pass everything after the subcommand to the handler
  return fn(argc - 1, argv + 1);
}
