#pragma once
#include "strata/repo.hpp"

namespace strata::cli {

// Open the repository for the current directory with a stderr sink that
// honours the log level from REPO/config (or STRATA_LOG).
Repository open_repository();

} // namespace strata::cli
