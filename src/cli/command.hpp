#pragma once

namespace strata::cli {

// Handler for one subcommand. argv[0] is the subcommand name.
using command_fn = int (*)(int argc, char** argv);

} // namespace strata::cli
