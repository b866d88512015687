#include "Clean.hpp"

#include "Builder/Builder.hpp"
#include "Cli.hpp"
#include "Common.hpp"

#include <rs/result.hpp>

namespace weld {

static rs::Result<void> cleanMain(CliArgsView args);

const Subcmd CLEAN_CMD = //
    Subcmd{ "clean" }
        .setDesc("Remove generated component artifacts and the temp directory")
        .addOpt(OPT_DIR)
        .addOpt(OPT_PROFILE)
        .addArg(Arg{ "COMPONENT" }
                    .setDesc("Components to clean; the temp directory is "
                             "kept when given (default: all)")
                    .setRequired(false)
                    .setVariadic(true))
        .setMainFn(cleanMain);

static rs::Result<void> cleanMain(const CliArgsView args) {
  const auto runArgs = rs_try(parseRunArgs(CLEAN_CMD, args));
  if (!runArgs.has_value()) {
    return rs::Ok();
  }

  const Builder builder = rs_try(loadBuilder(*runArgs));
  return builder.clean(runArgs->positional);
}

} // namespace weld
