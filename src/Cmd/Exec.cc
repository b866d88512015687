#include "Exec.hpp"

#include "Builder/Builder.hpp"
#include "Cli.hpp"
#include "Common.hpp"
#include "Parallelism.hpp"

#include <rs/result.hpp>
#include <string>
#include <vector>

namespace weld {

static rs::Result<void> execMain(CliArgsView args);

const Subcmd EXEC_CMD =
    Subcmd{ "exec" }
        .setDesc("Run a custom command on the components that define it")
        .addOpt(OPT_DIR)
        .addOpt(OPT_PROFILE)
        .addOpt(OPT_JOBS)
        .addOpt(OPT_FORCE)
        .addOpt(OPT_FAIL_FAST)
        .addOpt(OPT_REPORT)
        .addArg(Arg{ "COMMAND" }.setDesc("Name of the custom command"))
        .addArg(Arg{ "COMPONENT" }
                    .setDesc("Components to run it on (default: all)")
                    .setRequired(false)
                    .setVariadic(true))
        .setMainFn(execMain);

static rs::Result<void> execMain(const CliArgsView args) {
  const auto runArgs = rs_try(parseRunArgs(EXEC_CMD, args));
  if (!runArgs.has_value()) {
    return rs::Ok();
  }
  rs_ensure(!runArgs->positional.empty(),
            "missing custom command name\n\nFor more information, try "
            "'weld help exec'");

  const std::string& name = runArgs->positional.front();
  const std::vector<std::string> selection(runArgs->positional.begin() + 1,
                                           runArgs->positional.end());

  const Builder builder = rs_try(loadBuilder(*runArgs));
  WorkerPool pool(runArgs->jobs);
  const BuildReport report =
      rs_try(builder.exec(name, pool, runArgs->execute, selection));
  return finishReport(*runArgs, report);
}

} // namespace weld
