#include "cli/session.hpp"

#include <iostream>
#include <string_view>

int cmd_list(int argc, char **argv) {
  bool verbose = false;
  if (argc == 2 && std::string_view(argv[1]) == "verbose") {
    verbose = true;
  } else if (argc != 1) {
    std::cerr << "usage: strata list [verbose]\n";
    return 2;
  }

  try {
    auto repo = strata::cli::open_repository();
    std::cout << repo.list(verbose);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "list: " << e.what() << "\n";
    return 1;
  }
}
