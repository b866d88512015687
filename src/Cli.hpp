#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <rs/result.hpp>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace weld {

using CliArgsView = std::span<const std::string>;

class Opt {
  friend class Subcmd;
  friend class Cli;

  std::string name;
  std::string shortName;
  std::string desc;
  std::string placeholder;
  std::string defaultVal;

public:
  explicit Opt(std::string name) : name(std::move(name)) {}

  Opt& setShort(std::string shortName) {
    this->shortName = std::move(shortName);
    return *this;
  }
  Opt& setDesc(std::string desc) {
    this->desc = std::move(desc);
    return *this;
  }
  Opt& setPlaceholder(std::string placeholder) {
    this->placeholder = std::move(placeholder);
    return *this;
  }
  Opt& setDefault(std::string defaultVal) {
    this->defaultVal = std::move(defaultVal);
    return *this;
  }

  std::size_t leftSize() const;
  std::string format(std::size_t maxLeft) const;
};

class Arg {
  friend class Subcmd;

  std::string name;
  std::string desc;
  bool required = true;
  bool variadic = false;

public:
  explicit Arg(std::string name) : name(std::move(name)) {}

  Arg& setDesc(std::string desc) {
    this->desc = std::move(desc);
    return *this;
  }
  Arg& setRequired(const bool required) noexcept {
    this->required = required;
    return *this;
  }
  Arg& setVariadic(const bool variadic) noexcept {
    this->variadic = variadic;
    return *this;
  }

  std::string usage() const;
};

class Subcmd {
  friend class Cli;

  using MainFn = rs::Result<void>(CliArgsView);

  std::string name;
  std::string desc;
  std::vector<Opt> opts;
  std::vector<Arg> args;
  std::function<MainFn> mainFn;

public:
  explicit Subcmd(std::string name) : name(std::move(name)) {}

  Subcmd& setDesc(std::string desc) {
    this->desc = std::move(desc);
    return *this;
  }
  Subcmd& addOpt(Opt opt) {
    opts.push_back(std::move(opt));
    return *this;
  }
  Subcmd& addArg(Arg arg) {
    args.push_back(std::move(arg));
    return *this;
  }
  Subcmd& setMainFn(std::function<MainFn> mainFn) {
    this->mainFn = std::move(mainFn);
    return *this;
  }

  const std::string& getName() const noexcept { return name; }
  // Whether `arg` is the long or short form of one of this command's options.
  bool hasOpt(std::string_view arg) const noexcept;

  rs::Result<void> noSuchArg(std::string_view arg) const;
  static rs::Result<void> missingOptArgumentFor(std::string_view arg);
  void printHelp() const;
};

class Cli {
  friend class Subcmd;

  std::string name;
  std::string desc;
  std::vector<Opt> globalOpts;
  std::vector<Subcmd> subcmds;

public:
  enum ControlFlow : std::uint8_t {
    Return,
    Continue,
    Fallthrough,
  };

  Cli(std::string name, std::string desc)
      : name(std::move(name)), desc(std::move(desc)) {}

  Cli& addOpt(Opt opt) {
    globalOpts.push_back(std::move(opt));
    return *this;
  }
  Cli& addSubcmd(const Subcmd& subcmd) {
    subcmds.push_back(subcmd);
    return *this;
  }

  // Handles options valid anywhere: verbosity, color and help.  `subcmd`
  // names the command whose help `-h` prints, empty for the main help.
  static rs::Result<ControlFlow> handleGlobalOpts(CliArgsView::iterator& itr,
                                                  CliArgsView::iterator end,
                                                  std::string_view subcmd = "");

  bool hasSubcmd(std::string_view subcmd) const noexcept;
  rs::Result<void> exec(std::string_view subcmd, CliArgsView args) const;
  void printMainHelp() const;
  rs::Result<void> printHelp(CliArgsView args) const;

private:
  const Subcmd* findSubcmd(std::string_view subcmd) const noexcept;
};

const Cli& getCli();

} // namespace weld
