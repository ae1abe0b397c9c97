#include "strata/config.hpp"

#include "strata/consts.hpp"
#include "strata/fs.hpp"

#include <cstdlib>
#include <sstream>
#include <string_view>

namespace {

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::filesystem::path cfg_path(const std::filesystem::path &repo_root) {
  return repo_root / strata::consts::kRepoDir / strata::consts::kConfigFile;
}

} // namespace

namespace strata {

auto log_level_name(const std::optional<log::Level> &level) -> std::string {
  return level ? std::string(log::level_name(*level)) : std::string("quiet");
}

auto load_config(const std::filesystem::path &repo_root) -> Config {
  Config out{};
  const auto path = cfg_path(repo_root);
  if (fs::exists(path)) {
    std::istringstream iss(fs::to_string(fs::read_file(path)));
    std::string line;
    while (std::getline(iss, line)) {
      std::string_view sv{line};
      if (sv.empty() || sv[0] == '#')
        continue; // allow comments
      if (sv.starts_with(consts::kKeyLogLevel)) {
        out.log_level = log::parse_threshold(trim(sv.substr(consts::kKeyLogLevel.size())));
      }
    }
  }

  if (const char *env = std::getenv(std::string(consts::kEnvLogLevel).c_str());
      env != nullptr && *env != '\0') {
    out.log_level = log::parse_threshold(trim(env));
  }
  return out;
}

void save_config(const std::filesystem::path &repo_root, const Config &cfg) {
  std::ostringstream os;
  os << consts::kKeyLogLevel << ' ' << log_level_name(cfg.log_level) << '\n';
  fs::write_file_atomic(cfg_path(repo_root), fs::as_bytes(os.str()));
}

} // namespace strata
