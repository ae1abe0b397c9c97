#include "cli/session.hpp"

#include "strata/error.hpp"

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

int cmd_restore(int argc, char **argv) {
  if (argc > 3) {
    std::cerr << "usage: strata restore [cur|<rev>] [filter]\n";
    return 2;
  }

  std::optional<strata::Revision> target;
  if (argc >= 2 && std::string_view(argv[1]) != "cur") {
    const std::string_view s{argv[1]};
    strata::Revision r = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), r);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) {
      std::cerr << "restore: not a revision number: " << s << "\n";
      return 2;
    }
    target = r;
  }
  const std::string filter = argc == 3 ? argv[2] : ".*";

  try {
    auto repo = strata::cli::open_repository();
    repo.restore_to(target, filter);
    return 0;
  } catch (const strata::Error &e) {
    std::cerr << "restore: " << strata::to_string(e.kind()) << ": " << e.what() << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "restore: " << e.what() << "\n";
    return 1;
  }
}
