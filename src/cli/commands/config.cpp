#include "cli/session.hpp"

#include "strata/config.hpp"
#include "strata/log.hpp"

#include <iostream>
#include <string_view>

int cmd_config(int argc, char **argv) {
  if (argc > 3) {
    std::cerr << "usage: strata config [<key> [<value>]]\n";
    return 2;
  }
  if (argc >= 2 && std::string_view(argv[1]) != "log-level") {
    std::cerr << "config: unknown key: " << argv[1] << "\n";
    return 2;
  }

  try {
    auto repo = strata::cli::open_repository();
    auto cfg = strata::load_config(repo.root());
    if (argc < 3) {
      if (argc == 1)
        std::cout << "log-level: ";
      std::cout << strata::log_level_name(cfg.log_level) << "\n";
      return 0;
    }
    cfg.log_level = strata::log::parse_threshold(argv[2]);
    strata::save_config(repo.root(), cfg);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "config: " << e.what() << "\n";
    return 1;
  }
}
