#include "cli/session.hpp"

#include <iostream>

int cmd_status(int /*argc*/, char ** /*argv*/) {
  try {
    auto repo = strata::cli::open_repository();
    const auto changes = repo.status();
    if (changes.empty()) {
      std::cout << "nothing to commit (last revision " << repo.last_revision() << ")\n";
      return 0;
    }
    for (const auto &c : changes) {
      std::cout << "  " << strata::describe(c) << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "status: " << e.what() << "\n";
    return 1;
  }
}
