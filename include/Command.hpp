#pragma once

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace weld {

namespace fs = std::filesystem;

class ExitStatus {
  int rawStatus{ EXIT_SUCCESS };

public:
  ExitStatus() noexcept = default;
  explicit ExitStatus(const int status) noexcept : rawStatus(status) {}

  bool exitedNormally() const noexcept;
  bool killedBySignal() const noexcept;
  int exitCode() const noexcept;
  int termSignal() const noexcept;
  bool coreDumped() const noexcept;

  bool success() const noexcept;
  std::string toString() const;
};

struct CommandOutput {
  ExitStatus exitStatus;
  std::string stdOut;
  std::string stdErr;
};

class Child {
  pid_t pid;
  int stdOutPipe;
  int stdErrPipe;

  Child(pid_t pid, int stdOutPipe, int stdErrPipe) noexcept
      : pid(pid), stdOutPipe(stdOutPipe), stdErrPipe(stdErrPipe) {}

  friend class Command;

public:
  rs::Result<ExitStatus> wait() const noexcept;
  rs::Result<CommandOutput> waitWithOutput() const noexcept;
};

class Command {
public:
  enum class IOConfig : std::uint8_t {
    Null,
    Inherit,
    Piped,
  };

  explicit Command(std::string command) : command(std::move(command)) {}
  Command(std::string command, std::vector<std::string> arguments)
      : command(std::move(command)), arguments(std::move(arguments)) {}

  // Runs `script` through `/bin/sh -c`.
  static Command shell(std::string script);

  Command& addArg(const std::string_view arg) {
    arguments.emplace_back(arg);
    return *this;
  }
  Command& addArgs(const std::vector<std::string>& args) {
    arguments.insert(arguments.end(), args.begin(), args.end());
    return *this;
  }
  Command& setStdOutConfig(const IOConfig config) noexcept {
    stdOutConfig = config;
    return *this;
  }
  Command& setStdErrConfig(const IOConfig config) noexcept {
    stdErrConfig = config;
    return *this;
  }
  Command& setWorkingDirectory(fs::path dir) {
    workingDirectory = std::move(dir);
    return *this;
  }
  Command& setEnv(std::string name, std::string value) {
    envVars.emplace_back(std::move(name), std::move(value));
    return *this;
  }

  rs::Result<Child> spawn() const noexcept;
  rs::Result<CommandOutput> output() const noexcept;

  std::string toString() const;

private:
  std::string command;
  std::vector<std::string> arguments;
  std::vector<std::pair<std::string, std::string>> envVars;
  fs::path workingDirectory;
  IOConfig stdOutConfig = IOConfig::Inherit;
  IOConfig stdErrConfig = IOConfig::Inherit;
};

} // namespace weld

template <>
struct fmt::formatter<weld::ExitStatus> : formatter<std::string> {
  auto format(const weld::ExitStatus& status, format_context& ctx) const {
    return formatter<std::string>::format(status.toString(), ctx);
  }
};

template <>
struct fmt::formatter<weld::Command> : formatter<std::string> {
  auto format(const weld::Command& cmd, format_context& ctx) const {
    return formatter<std::string>::format(cmd.toString(), ctx);
  }
};
