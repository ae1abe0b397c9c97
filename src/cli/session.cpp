#include "cli/session.hpp"

#include "strata/config.hpp"
#include "strata/consts.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace strata::cli {

namespace {

// Used until REPO/config can be read.
std::optional<log::Level> initial_threshold() {
  const char *env = std::getenv(std::string(consts::kEnvLogLevel).c_str());
  if (env == nullptr || *env == '\0') {
    return Config{}.log_level;
  }
  return log::parse_threshold(env);
}

} // namespace

Repository open_repository() {
  auto threshold = std::make_shared<std::optional<log::Level>>(initial_threshold());
  log::Sink sink = [threshold](log::Level level, std::string_view msg) {
    if (*threshold && level >= **threshold) {
      std::cerr << "strata: " << msg << "\n";
    }
  };
  auto repo = Repository::open(std::filesystem::current_path(), std::move(sink));
  *threshold = load_config(repo.root()).log_level;
  return repo;
}

} // namespace strata::cli
