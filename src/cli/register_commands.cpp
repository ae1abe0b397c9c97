#include "cli/registry.hpp"

int cmd_commit(int argc, char **argv);
int cmd_list(int, char **);
int cmd_restore(int, char **);
int cmd_status(int, char **);
int cmd_config(int, char **);

namespace strata::cli {

void register_all_commands() {
  register_command("commit", ::cmd_commit, "Record the working tree: strata commit <comment...>");
  register_command("list", ::cmd_list, "Show the commit log: strata list [verbose]");
  register_command("restore", ::cmd_restore,
                   "Restore a revision: strata restore [cur|<rev>] [filter]");
  register_command("status", ::cmd_status, "Show what the next commit would record");
  register_command("config", ::cmd_config, "Show or set options: strata config [<key> [<value>]]");
}

} // namespace strata::cli
