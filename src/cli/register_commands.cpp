#include "cli/registry.hpp"

int cmd_extract(int argc, char **argv);
int cmd_rebuild(int argc, char **argv);

namespace gitreplay::cli {

void register_all_commands() {
  register_command("extract", ::cmd_extract,
                   "Export branch history: gitreplay extract [--branch <name>] "
                   "[--export-dir <dir>]");
  register_command("rebuild", ::cmd_rebuild,
                   "Replay an export into ./<name>: gitreplay rebuild [--export-dir <dir>] "
                   "[--missing-parents fail|drop]");
}

} // namespace gitreplay::cli
