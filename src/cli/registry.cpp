#include "cli/registry.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <map>

namespace strata::cli {

struct entry {
  command_fn fn;
  std::string help;
};
static std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  table()[name] = entry{.fn = fn, .help = help};
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : it->second.fn;
}

void print_usage() {
  std::size_t width = 0;
  for (const auto &[name, _] : table())
    width = std::max(width, name.size());

  std::cerr << "usage: strata <command> [args]\n\n";
  std::cerr << "The repository is the nearest REPO directory at or above the current one;\n"
               "a new one is created here if there is none.\n\n";
  std::cerr << "commands:\n";
  for (const auto &[name, e] : table()) {
    std::cerr << "  " << std::left << std::setw(static_cast<int>(width)) << name << "  " << e.help
              << "\n";
  }
}

} // namespace strata::cli
