#include "List.hpp"

#include "Builder/Builder.hpp"
#include "Cli.hpp"
#include "Common.hpp"
#include "TermColor.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <rs/result.hpp>
#include <string>
#include <vector>

namespace weld {

static rs::Result<void> listMain(CliArgsView args);

const Subcmd LIST_CMD = //
    Subcmd{ "list" }
        .setDesc("List resolved components with their dependencies")
        .addOpt(OPT_DIR)
        .addOpt(OPT_PROFILE)
        .setMainFn(listMain);

static rs::Result<void> listMain(const CliArgsView args) {
  const auto runArgs = rs_try(parseRunArgs(LIST_CMD, args));
  if (!runArgs.has_value()) {
    return rs::Ok();
  }
  if (!runArgs->positional.empty()) {
    return LIST_CMD.noSuchArg(runArgs->positional.front());
  }

  const Builder builder = rs_try(loadBuilder(*runArgs));
  for (const ResolvedComponent& comp : builder.components()) {
    std::vector<std::string> deps;
    for (const ComponentDependency& dep : comp.dependencies) {
      deps.push_back(fmt::format("{} ({})", dep.target, dep.type));
    }

    fmt::print("{}", bold(comp.name));
    if (comp.profile.has_value()) {
      fmt::print(" {}", gray(fmt::format("[{}]", *comp.profile)));
    }
    fmt::print("\n");
    fmt::print("  build steps: {}\n",
               comp.properties.build.has_value() ? comp.properties.build->size()
                                                 : 0);
    if (!deps.empty()) {
      fmt::print("  depends on: {}\n", fmt::join(deps, ", "));
    }
    if (!comp.properties.customCommands.empty()) {
      std::vector<std::string> names;
      for (const auto& [name, cmds] : comp.properties.customCommands) {
        names.push_back(name);
      }
      fmt::print("  custom commands: {}\n", fmt::join(names, ", "));
    }
  }
  return rs::Ok();
}

} // namespace weld
