#include "Help.hpp"

#include "Cli.hpp"

namespace weld {

static rs::Result<void> helpMain(CliArgsView args);

const Subcmd HELP_CMD = //
    Subcmd{ "help" }
        .setDesc("Displays help for a weld subcommand")
        .addArg(Arg{ "COMMAND" }.setRequired(false))
        .setMainFn(helpMain);

static rs::Result<void> helpMain(const CliArgsView args) {
  return getCli().printHelp(args);
}

} // namespace weld
