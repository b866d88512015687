#pragma once

#include "Builder/BuildProfile.hpp"
#include "Builder/BuildReport.hpp"
#include "Builder/Builder.hpp"
#include "Builder/Executor.hpp"
#include "Cli.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <vector>

namespace weld {

namespace fs = std::filesystem;

inline const Opt OPT_DIR = Opt{ "--manifest-dir" }
                               .setShort("-C")
                               .setDesc("Run as if started in <DIR>")
                               .setPlaceholder("<DIR>");
inline const Opt OPT_PROFILE = Opt{ "--profile" }
                                   .setShort("-p")
                                   .setDesc("Select the component profile")
                                   .setPlaceholder("<PROFILE>");
inline const Opt OPT_JOBS = Opt{ "--jobs" }
                                .setShort("-j")
                                .setDesc("Number of components built in parallel")
                                .setPlaceholder("<NUM>")
                                .setDefault("# of CPUs");
inline const Opt OPT_FORCE =
    Opt{ "--force" }.setDesc("Run every step regardless of staleness");
inline const Opt OPT_FAIL_FAST = Opt{ "--fail-fast" }.setDesc(
    "Stop dispatching components after the first failure");
inline const Opt OPT_REPORT =
    Opt{ "--report" }
        .setDesc("Write a JSON report of the run to <FILE>")
        .setPlaceholder("<FILE>");

// Options shared by the commands that load a manifest.
struct RunArgs {
  fs::path manifestDir = ".";
  std::optional<BuildProfile> profile;
  std::size_t jobs = 1;
  ExecuteOptions execute;
  std::optional<fs::path> reportPath;
  std::vector<std::string> positional;
};

// Returns nothing when help was printed and the command should stop.
// Options `cmd` does not declare are rejected.
rs::Result<std::optional<RunArgs>> parseRunArgs(const Subcmd& cmd,
                                                CliArgsView args);

// Loads `weld.toml` from the chosen directory and schedules it.
rs::Result<Builder> loadBuilder(const RunArgs& args);

// Writes the JSON report if requested and fails when the run did.
rs::Result<void> finishReport(const RunArgs& args, const BuildReport& report);

} // namespace weld
