#include "Cli.hpp"

#include "Algos.hpp"
#include "Diag.hpp"
#include "TermColor.hpp"

#include <algorithm>
#include <cstddef>
#include <fmt/format.h>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace weld {

std::size_t Opt::leftSize() const {
  // `-s, --name <PH>`
  std::size_t size = 4 + name.size();
  if (!placeholder.empty()) {
    size += 1 + placeholder.size();
  }
  return size;
}

std::string Opt::format(const std::size_t maxLeft) const {
  std::string left = shortName.empty() ? "    " : fmt::format("{}, ", shortName);
  left += name;
  if (!placeholder.empty()) {
    left += fmt::format(" {}", placeholder);
  }

  std::string line = fmt::format("  {:<{}}  {}", left, maxLeft, desc);
  if (!defaultVal.empty()) {
    line += fmt::format(" [default: {}]", defaultVal);
  }
  return line;
}

std::string Arg::usage() const {
  std::string usage = required ? fmt::format("<{}>", name)
                               : fmt::format("[{}]", name);
  if (variadic) {
    usage += "...";
  }
  return usage;
}

bool Subcmd::hasOpt(const std::string_view arg) const noexcept {
  return std::ranges::any_of(opts, [arg](const Opt& opt) {
    return opt.name == arg || (!opt.shortName.empty() && opt.shortName == arg);
  });
}

rs::Result<void> Subcmd::noSuchArg(const std::string_view arg) const {
  rs_bail("unexpected argument '{}' found\n\n"
          "For more information, try '{}'",
          arg, bold(cyan(fmt::format("weld help {}", name))));
}

rs::Result<void> Subcmd::missingOptArgumentFor(const std::string_view arg) {
  rs_bail("Missing argument for `{}`", arg);
}

void Subcmd::printHelp() const {
  std::string usage = fmt::format("weld {} [OPTIONS]", name);
  for (const Arg& arg : args) {
    usage += fmt::format(" {}", arg.usage());
  }

  std::size_t maxLeft = 0;
  for (const Opt& opt : opts) {
    maxLeft = std::max(maxLeft, opt.leftSize());
  }
  for (const Opt& opt : getCli().globalOpts) {
    maxLeft = std::max(maxLeft, opt.leftSize());
  }

  fmt::print("{}\n\n", desc);
  fmt::print("{} {}\n\n", bold(green("Usage:")), bold(cyan(usage)));
  fmt::print("{}\n", bold(green("Options:")));
  for (const Opt& opt : getCli().globalOpts) {
    fmt::print("{}\n", opt.format(maxLeft));
  }
  for (const Opt& opt : opts) {
    fmt::print("{}\n", opt.format(maxLeft));
  }

  if (!args.empty()) {
    fmt::print("\n{}\n", bold(green("Arguments:")));
    for (const Arg& arg : args) {
      fmt::print("  {:<{}}  {}\n", arg.usage(), maxLeft, arg.desc);
    }
  }
}

rs::Result<Cli::ControlFlow>
Cli::handleGlobalOpts(CliArgsView::iterator& itr,
                      const CliArgsView::iterator end,
                      const std::string_view subcmd) {
  const std::string_view arg = *itr;

  if (matchesAny(arg, { "-h", "--help" })) {
    if (subcmd.empty()) {
      getCli().printMainHelp();
    } else {
      const Subcmd* cmd = getCli().findSubcmd(subcmd);
      rs_ensure(cmd != nullptr, "no such command `{}`", subcmd);
      cmd->printHelp();
    }
    return rs::Ok(Return);
  } else if (matchesAny(arg, { "-v", "--verbose" })) {
    spdlog::set_level(spdlog::level::debug);
    return rs::Ok(Continue);
  } else if (arg == "-vv") {
    spdlog::set_level(spdlog::level::trace);
    return rs::Ok(Continue);
  } else if (matchesAny(arg, { "-q", "--quiet" })) {
    Diag::setLevel(DiagLevel::Error);
    return rs::Ok(Continue);
  } else if (arg == "--color") {
    if (itr + 1 == end) {
      rs_bail("Missing argument for `{}`", arg);
    }
    const std::string_view when = *++itr;
    rs_ensure(matchesAny(when, { "auto", "always", "never" }),
              "invalid argument for `--color`: `{}` (expected `auto`, "
              "`always`, or `never`)",
              when);
    setColorMode(when);
    return rs::Ok(Continue);
  }
  return rs::Ok(Fallthrough);
}

const Subcmd* Cli::findSubcmd(const std::string_view subcmd) const noexcept {
  const auto itr = std::ranges::find_if(
      subcmds, [subcmd](const Subcmd& cmd) { return cmd.name == subcmd; });
  return itr == subcmds.end() ? nullptr : &*itr;
}

bool Cli::hasSubcmd(const std::string_view subcmd) const noexcept {
  return findSubcmd(subcmd) != nullptr;
}

rs::Result<void> Cli::exec(const std::string_view subcmd,
                           const CliArgsView args) const {
  const Subcmd* cmd = findSubcmd(subcmd);
  rs_ensure(cmd != nullptr,
            "no such command: `{}`\n\nFor a list of commands, try '{}'", subcmd,
            bold(cyan("weld help")));
  return cmd->mainFn(args);
}

void Cli::printMainHelp() const {
  std::size_t maxLeft = 0;
  for (const Opt& opt : globalOpts) {
    maxLeft = std::max(maxLeft, opt.leftSize());
  }
  for (const Subcmd& cmd : subcmds) {
    maxLeft = std::max(maxLeft, cmd.name.size());
  }

  fmt::print("{}\n\n", desc);
  fmt::print("{} {}\n\n", bold(green("Usage:")),
             bold(cyan(fmt::format("{} [OPTIONS] [COMMAND]", name))));
  fmt::print("{}\n", bold(green("Options:")));
  for (const Opt& opt : globalOpts) {
    fmt::print("{}\n", opt.format(maxLeft));
  }
  fmt::print("\n{}\n", bold(green("Commands:")));
  for (const Subcmd& cmd : subcmds) {
    fmt::print("  {}  {}\n", bold(cyan(fmt::format("{:<{}}", cmd.name, maxLeft))),
               cmd.desc);
  }
  fmt::print("\nSee '{}' for more information on a specific command.\n",
             bold(cyan(fmt::format("{} help <command>", name))));
}

rs::Result<void> Cli::printHelp(const CliArgsView args) const {
  if (args.empty()) {
    printMainHelp();
    return rs::Ok();
  }
  const Subcmd* cmd = findSubcmd(args.front());
  rs_ensure(cmd != nullptr, "no such command: `{}`", args.front());
  cmd->printHelp();
  return rs::Ok();
}

} // namespace weld
