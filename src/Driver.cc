#include "Driver.hpp"

#include "Cli.hpp"
#include "Cmd/Build.hpp"
#include "Cmd/Clean.hpp"
#include "Cmd/Exec.hpp"
#include "Cmd/Help.hpp"
#include "Cmd/List.hpp"
#include "Diag.hpp"

#include <exception>
#include <fmt/core.h>
#include <rs/result.hpp>
#include <span>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

#ifndef WELD_PKG_VERSION
#  error "WELD_PKG_VERSION is not defined"
#endif

namespace weld {

const Cli& getCli() {
  static const Cli cli = //
      Cli{ "weld", "A build orchestrator for multi-component WebAssembly "
                   "applications" }
          .addOpt(Opt{ "--verbose" }
                      .setShort("-v")
                      .setDesc("Use verbose output (-vv very verbose output)"))
          .addOpt(Opt{ "--quiet" }
                      .setShort("-q")
                      .setDesc("Do not print weld log messages"))
          .addOpt(Opt{ "--color" }
                      .setDesc("Coloring: auto, always, never")
                      .setPlaceholder("<WHEN>")
                      .setDefault("auto"))
          .addOpt(Opt{ "--help" }.setShort("-h").setDesc("Print help"))
          .addOpt(Opt{ "--version" }
                      .setShort("-V")
                      .setDesc("Print version info and exit"))
          .addSubcmd(BUILD_CMD)
          .addSubcmd(CLEAN_CMD)
          .addSubcmd(EXEC_CMD)
          .addSubcmd(HELP_CMD)
          .addSubcmd(LIST_CMD);
  return cli;
}

static rs::Result<void> parseArgs(const CliArgsView args) {
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = rs_try(Cli::handleGlobalOpts(itr, args.end()));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (arg == "-V" || arg == "--version") {
      fmt::print("weld {}\n", WELD_PKG_VERSION);
      return rs::Ok();
    } else if (getCli().hasSubcmd(arg)) {
      return getCli().exec(arg, CliArgsView(itr + 1, args.end()));
    }
    rs_bail("no such command: `{}`\n\nFor a list of commands, try 'weld "
            "help'",
            arg);
  }

  getCli().printMainHelp();
  return rs::Ok();
}

rs::Result<void, void> run(int argc, char* argv[]) noexcept {
  spdlog::set_pattern("%^[%l]%$ %v");
  spdlog::set_level(spdlog::level::warn);

  try {
    // NOLINTNEXTLINE(*-pointer-arithmetic)
    const std::vector<std::string> args(argv + 1, argv + argc);
    const auto result = parseArgs(args);
    if (result.is_err()) {
      Diag::error("{}", result.unwrap_err()->what());
      return rs::Err();
    }
  } catch (const std::exception& e) {
    Diag::error("{}", e.what());
    return rs::Err();
  }
  return rs::Ok();
}

} // namespace weld
