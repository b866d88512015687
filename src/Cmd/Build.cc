#include "Build.hpp"

#include "Builder/Builder.hpp"
#include "Cli.hpp"
#include "Common.hpp"
#include "Parallelism.hpp"

#include <rs/result.hpp>

namespace weld {

static rs::Result<void> buildMain(CliArgsView args);

const Subcmd BUILD_CMD =
    Subcmd{ "build" }
        .setDesc("Build components in dependency order, skipping fresh steps")
        .addOpt(OPT_DIR)
        .addOpt(OPT_PROFILE)
        .addOpt(OPT_JOBS)
        .addOpt(OPT_FORCE)
        .addOpt(OPT_FAIL_FAST)
        .addOpt(OPT_REPORT)
        .addArg(Arg{ "COMPONENT" }
                    .setDesc("Components to build, with the components they "
                             "link (default: all)")
                    .setRequired(false)
                    .setVariadic(true))
        .setMainFn(buildMain);

static rs::Result<void> buildMain(const CliArgsView args) {
  const auto runArgs = rs_try(parseRunArgs(BUILD_CMD, args));
  if (!runArgs.has_value()) {
    return rs::Ok();
  }

  const Builder builder = rs_try(loadBuilder(*runArgs));
  WorkerPool pool(runArgs->jobs);
  const BuildReport report =
      rs_try(builder.build(pool, runArgs->execute, runArgs->positional));
  return finishReport(*runArgs, report);
}

} // namespace weld
