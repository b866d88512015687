#include "Common.hpp"

#include "Algos.hpp"
#include "Diag.hpp"
#include "Manifest.hpp"
#include "Parallelism.hpp"

#include <charconv>
#include <cstdint>
#include <fstream>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace weld {

rs::Result<std::optional<RunArgs>> parseRunArgs(const Subcmd& cmd,
                                                const CliArgsView args) {
  RunArgs runArgs;
  runArgs.jobs = defaultParallelism();

  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control =
        rs_try(Cli::handleGlobalOpts(itr, args.end(), cmd.getName()));
    if (control == Cli::Return) {
      return rs::Ok(std::optional<RunArgs>());
    } else if (control == Cli::Continue) {
      continue;
    }

    if (!arg.starts_with('-')) {
      runArgs.positional.emplace_back(arg);
      continue;
    }
    if (!cmd.hasOpt(arg)) {
      rs_try(cmd.noSuchArg(arg));
    }

    if (matchesAny(arg, { "--force" })) {
      runArgs.execute.forceBuild = true;
      continue;
    } else if (matchesAny(arg, { "--fail-fast" })) {
      runArgs.execute.failurePolicy = FailurePolicy::FailFast;
      continue;
    }

    // Everything below takes a value.
    if (itr + 1 == args.end()) {
      rs_try(Subcmd::missingOptArgumentFor(arg));
    }
    const std::string_view nextArg = *++itr;

    if (matchesAny(arg, { "-C", "--manifest-dir" })) {
      runArgs.manifestDir = nextArg;
    } else if (matchesAny(arg, { "-p", "--profile" })) {
      runArgs.profile.emplace(std::string(nextArg));
    } else if (matchesAny(arg, { "-j", "--jobs" })) {
      std::uint64_t numThreads{};
      const char* last = nextArg.data() + nextArg.size();
      auto [ptr, ec] = std::from_chars(nextArg.data(), last, numThreads);
      rs_ensure(ec == std::errc() && ptr == last && numThreads > 0,
                "invalid number of jobs: {}", nextArg);
      runArgs.jobs = numThreads;
    } else if (arg == "--report") {
      runArgs.reportPath = fs::path(nextArg);
    }
  }
  // `-v` may come before or after the subcommand; either way it has set the
  // log level by now.
  runArgs.execute.echoOutput = spdlog::should_log(spdlog::level::debug);
  return rs::Ok(std::optional<RunArgs>(std::move(runArgs)));
}

rs::Result<Builder> loadBuilder(const RunArgs& args) {
  const fs::path manifestPath = args.manifestDir / Manifest::FILE_NAME;
  spdlog::debug("Loading manifest: {}", manifestPath.string());

  Builder builder(rs_try(Manifest::tryParse(manifestPath)));
  rs_try(builder.schedule(args.profile));
  return rs::Ok(std::move(builder));
}

rs::Result<void> finishReport(const RunArgs& args, const BuildReport& report) {
  if (args.reportPath.has_value()) {
    std::ofstream ofs(*args.reportPath);
    rs_ensure(ofs.is_open(), "cannot write report to `{}`",
              args.reportPath->string());
    ofs << report.toJson().dump(2) << '\n';
    Diag::info("Wrote", "{}", args.reportPath->string());
  }
  rs_ensure(report.success(), "`{}` failed", report.commandName);
  return rs::Ok();
}

} // namespace weld
