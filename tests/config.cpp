#include "strata/config.hpp"
#include "strata/error.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;
using strata::log::Level;

static void spit(const fs::path &p, const std::string &s) {
  fs::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << s;
}

int main() {
  const auto base = fs::temp_directory_path();
  const std::string suffix = std::to_string(std::random_device{}());
  const fs::path root = base / ("strata_config_test_" + suffix);

  try {
    ::unsetenv("STRATA_LOG");
    fs::create_directories(root / "REPO");

    if (strata::load_config(root).log_level != Level::Warn) {
      std::cerr << "default level should be warn\n";
      return 1;
    }

    spit(root / "REPO" / "config", "# comment\nunknown: 1\nlog-level:   debug  \r\n");
    if (strata::load_config(root).log_level != Level::Debug) {
      std::cerr << "log-level not parsed\n";
      return 1;
    }

    strata::save_config(root, strata::Config{.log_level = std::nullopt});
    const auto quiet = strata::load_config(root);
    if (quiet.log_level.has_value() || strata::log_level_name(quiet.log_level) != "quiet") {
      std::cerr << "quiet did not round trip\n";
      return 1;
    }

    ::setenv("STRATA_LOG", "info", 1);
    if (strata::load_config(root).log_level != Level::Info) {
      std::cerr << "environment override ignored\n";
      return 1;
    }
    ::unsetenv("STRATA_LOG");

    spit(root / "REPO" / "config", "log-level: loud\n");
    bool threw = false;
    try {
      (void)strata::load_config(root);
    } catch (const strata::Error &e) {
      threw = e.kind() == strata::ErrorKind::MalformedMetadata;
    }
    if (!threw) {
      std::cerr << "unknown level accepted\n";
      return 1;
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
