#pragma once
#include "strata/log.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace strata {

struct Config {
  // nullopt means quiet
  std::optional<log::Level> log_level = log::Level::Warn;
};

// Read REPO/config under `repo_root` (defaults if missing), then apply the
// STRATA_LOG environment override. Throws Error{MalformedMetadata} on an
// unknown level name.
Config load_config(const std::filesystem::path& repo_root);

// Overwrite REPO/config with `cfg`
void save_config(const std::filesystem::path& repo_root, const Config& cfg);

auto log_level_name(const std::optional<log::Level>& level) -> std::string;

} // namespace strata
